#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace deckhand::core {

// A field of a shortcut entry the codec does not model. Kept byte-for-byte so that
// rewriting the database never drops data written by the game library itself.
struct RawVdfField {
    std::uint8_t type;
    std::string key;
    std::vector<std::uint8_t> value; // encoded value bytes, without type and key

    bool operator==(const RawVdfField&) const = default;
};

struct ShortcutEntry {
    std::uint32_t app_id = 0;
    std::string name;
    std::string exe;
    std::string start_dir;
    std::string launch_options;
    std::vector<std::string> tags;
    std::optional<std::int64_t> last_played;
    std::vector<RawVdfField> extra_fields;

    bool operator==(const ShortcutEntry&) const = default;
};

struct ArtworkConfig {
    std::string grid;   // 600x900 portrait
    std::string hero;   // 1920x620 header
    std::string logo;   // transparent logo
    std::string icon;   // square icon
    std::string banner; // 460x215 horizontal

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ArtworkConfig, grid, hero, logo, icon, banner)
};

// What the hub asks for when it creates a shortcut
struct ShortcutConfig {
    std::string name;
    std::string exe;
    std::string start_dir;
    std::string launch_options;
    std::vector<std::string> tags;
    std::optional<ArtworkConfig> artwork;
};

inline void to_json(nlohmann::json& j, const ShortcutConfig& config) {
    j = nlohmann::json{
        {"name", config.name},
        {"exe", config.exe},
        {"start_dir", config.start_dir},
        {"launch_options", config.launch_options},
        {"tags", config.tags},
    };
    if (config.artwork) {
        j["artwork"] = *config.artwork;
    }
}

inline void from_json(const nlohmann::json& j, ShortcutConfig& config) {
    config.name = j.value("name", "");
    config.exe = j.value("exe", "");
    config.start_dir = j.value("start_dir", "");
    config.launch_options = j.value("launch_options", "");
    config.tags = j.value("tags", std::vector<std::string>{});
    if (j.contains("artwork") && !j["artwork"].is_null()) {
        config.artwork = j["artwork"].get<ArtworkConfig>();
    } else {
        config.artwork.reset();
    }
}

// Shortcut as listed to the hub
struct ShortcutInfo {
    std::uint32_t app_id = 0;
    std::string name;
    std::string exe;
    std::string start_dir;
    std::string launch_options;
    std::vector<std::string> tags;
    std::int64_t last_played = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(
        ShortcutInfo, app_id, name, exe, start_dir, launch_options, tags, last_played)

    static ShortcutInfo FromEntry(const ShortcutEntry& entry) {
        return ShortcutInfo{
            .app_id = entry.app_id,
            .name = entry.name,
            .exe = entry.exe,
            .start_dir = entry.start_dir,
            .launch_options = entry.launch_options,
            .tags = entry.tags,
            .last_played = entry.last_played.value_or(0),
        };
    }
};

} // namespace deckhand::core
