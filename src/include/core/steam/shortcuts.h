#pragma once

#include <core/model/shortcut.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace deckhand::core {

// Deterministic id of a non-native library entry:
// CRC32(exe + name) with the shortcut bits 0x80000000 and 0x02000000 set.
std::uint32_t GenerateAppId(std::string_view exe, std::string_view name);

// Entry for a new shortcut, with the fields the game library expects to find
ShortcutEntry MakeShortcutEntry(const ShortcutConfig& config);

// In-memory view of one user's shortcuts database
class ShortcutsFile {
public:
    explicit ShortcutsFile(std::filesystem::path path);

    // A missing file loads as an empty database; a corrupt one throws VdfError
    void Load();
    void Save() const;

    // Inserts or replaces the entry with the same app id; returns the app id
    std::uint32_t Add(ShortcutEntry entry);
    bool Remove(std::uint32_t app_id);
    std::optional<ShortcutEntry> Find(std::uint32_t app_id) const;

    const std::vector<ShortcutEntry>& entries() const { return entries_; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::vector<ShortcutEntry> entries_;
};

} // namespace deckhand::core
