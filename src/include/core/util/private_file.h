#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace deckhand::core {

// Replaces `file` with `content`, readable and writable by the owner only (0600).
// Throws std::runtime_error on failure.
void WritePrivateFile(const std::filesystem::path& file, std::string_view content);

// Renames an unreadable `file` to `<file>.bad`, replacing an older one, and
// returns the new path. Throws std::filesystem::filesystem_error.
std::filesystem::path MoveAside(const std::filesystem::path& file);

// Whole file contents, std::nullopt when it does not exist
std::optional<std::string> ReadTextFile(const std::filesystem::path& file);

} // namespace deckhand::core
