#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace deckhand::core {

struct SteamUser {
    std::string id; // numeric account id, the userdata directory name
};

class SteamPaths {
public:
    explicit SteamPaths(std::filesystem::path root);

    // Looks in the usual native and flatpak install locations
    static std::optional<SteamPaths> Detect();

    std::vector<SteamUser> Users() const;

    std::filesystem::path UserDataDir(const std::string& user_id) const;
    std::filesystem::path ShortcutsPath(const std::string& user_id) const;
    std::filesystem::path GridDir(const std::string& user_id) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

} // namespace deckhand::core
