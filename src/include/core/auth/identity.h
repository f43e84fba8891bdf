#pragma once

#include <filesystem>
#include <string>

namespace deckhand::core {

// Durable self identifier: read from `file`, or generated once and persisted (0600)
std::string LoadOrCreateIdentity(const std::filesystem::path& file);

} // namespace deckhand::core
