#include <algorithm>
#include <core/steam/steam_paths.h>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace deckhand::core {

SteamPaths::SteamPaths(std::filesystem::path root)
    : root_(std::move(root)) {}

std::optional<SteamPaths> SteamPaths::Detect() {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        return std::nullopt;
    }
    const std::filesystem::path home_dir(home);
    const std::filesystem::path candidates[] = {
        home_dir / ".steam" / "steam",
        home_dir / ".local" / "share" / "Steam",
        home_dir / ".var" / "app" / "com.valvesoftware.Steam" / ".local" / "share" / "Steam",
    };
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (std::filesystem::is_directory(candidate / "userdata", ec)) {
            auto root = std::filesystem::canonical(candidate, ec);
            spdlog::debug("Steam root found at {}", candidate.string());
            return SteamPaths(ec ? candidate : root);
        }
    }
    return std::nullopt;
}

std::vector<SteamUser> SteamPaths::Users() const {
    std::vector<SteamUser> users;
    std::error_code ec;
    auto userdata = root_ / "userdata";
    if (!std::filesystem::is_directory(userdata, ec)) {
        return users;
    }
    for (const auto& entry : std::filesystem::directory_iterator(userdata, ec)) {
        if (!entry.is_directory()) {
            continue;
        }
        auto name = entry.path().filename().string();
        // "0" is the anonymous account
        if (name.empty() || name == "0"
            || !std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            continue;
        }
        users.push_back(SteamUser{name});
    }
    std::sort(users.begin(), users.end(), [](const SteamUser& a, const SteamUser& b) {
        return a.id < b.id;
    });
    return users;
}

std::filesystem::path SteamPaths::UserDataDir(const std::string& user_id) const {
    return root_ / "userdata" / user_id;
}

std::filesystem::path SteamPaths::ShortcutsPath(const std::string& user_id) const {
    return UserDataDir(user_id) / "config" / "shortcuts.vdf";
}

std::filesystem::path SteamPaths::GridDir(const std::string& user_id) const {
    return UserDataDir(user_id) / "config" / "grid";
}

} // namespace deckhand::core
