#include <algorithm>
#include <boost/crc.hpp>
#include <core/steam/shortcuts.h>
#include <core/steam/vdf.h>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace deckhand::core {

namespace {

RawVdfField stringField(std::string key, std::string_view value) {
    std::vector<std::uint8_t> bytes(value.begin(), value.end());
    bytes.push_back(0x00);
    return RawVdfField{vdf::kTypeString, std::move(key), std::move(bytes)};
}

RawVdfField intField(std::string key, std::uint32_t value) {
    return RawVdfField{vdf::kTypeInt32,
                       std::move(key),
                       {static_cast<std::uint8_t>(value),
                        static_cast<std::uint8_t>(value >> 8),
                        static_cast<std::uint8_t>(value >> 16),
                        static_cast<std::uint8_t>(value >> 24)}};
}

std::string quotePath(std::string_view value) {
    if (value.empty() || value.front() == '"') {
        return std::string(value);
    }
    return "\"" + std::string(value) + "\"";
}

} // namespace

std::uint32_t GenerateAppId(std::string_view exe, std::string_view name) {
    boost::crc_32_type crc;
    crc.process_bytes(exe.data(), exe.size());
    crc.process_bytes(name.data(), name.size());
    return crc.checksum() | 0x80000000u | 0x02000000u;
}

ShortcutEntry MakeShortcutEntry(const ShortcutConfig& config) {
    ShortcutEntry entry;
    entry.exe = quotePath(config.exe);
    entry.start_dir = quotePath(config.start_dir);
    entry.name = config.name;
    entry.launch_options = config.launch_options;
    entry.tags = config.tags;
    entry.app_id = GenerateAppId(entry.exe, entry.name);
    entry.extra_fields = {
        stringField("icon", ""),
        stringField("ShortcutPath", ""),
        intField("IsHidden", 0),
        intField("AllowDesktopConfig", 1),
        intField("AllowOverlay", 1),
        intField("OpenVR", 0),
        intField("Devkit", 0),
        stringField("DevkitGameID", ""),
        intField("DevkitOverrideAppID", 0),
        stringField("FlatpakAppID", ""),
    };
    return entry;
}

ShortcutsFile::ShortcutsFile(std::filesystem::path path)
    : path_(std::move(path)) {}

void ShortcutsFile::Load() {
    entries_.clear();
    if (!std::filesystem::exists(path_)) {
        return;
    }
    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open shortcuts file: " + path_.string());
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(file)),
                                   std::istreambuf_iterator<char>());
    entries_ = vdf::ParseShortcuts(data);
}

void ShortcutsFile::Save() const {
    std::filesystem::create_directories(path_.parent_path());
    auto data = vdf::WriteShortcuts(entries_);

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Failed to open shortcuts file for writing: " + tmp.string());
        }
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!file) {
            throw std::runtime_error("Failed to write shortcuts file: " + tmp.string());
        }
    }
    std::filesystem::rename(tmp, path_);
}

std::uint32_t ShortcutsFile::Add(ShortcutEntry entry) {
    auto app_id = entry.app_id;
    auto it = std::find_if(entries_.begin(), entries_.end(), [app_id](const ShortcutEntry& e) {
        return e.app_id == app_id;
    });
    if (it != entries_.end()) {
        // keep what the library stored for the entry we replace
        if (entry.extra_fields.empty()) {
            entry.extra_fields = std::move(it->extra_fields);
        }
        if (!entry.last_played) {
            entry.last_played = it->last_played;
        }
        *it = std::move(entry);
    } else {
        entries_.push_back(std::move(entry));
    }
    return app_id;
}

bool ShortcutsFile::Remove(std::uint32_t app_id) {
    auto removed = std::erase_if(entries_, [app_id](const ShortcutEntry& e) {
        return e.app_id == app_id;
    });
    return removed > 0;
}

std::optional<ShortcutEntry> ShortcutsFile::Find(std::uint32_t app_id) const {
    auto it = std::find_if(entries_.begin(), entries_.end(), [app_id](const ShortcutEntry& e) {
        return e.app_id == app_id;
    });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return *it;
}

} // namespace deckhand::core
