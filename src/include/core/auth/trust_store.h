#pragma once

#include <core/model/authorized_hub.h>
#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace deckhand::core {

// Hubs this agent has paired with, persisted as JSON (0600). The map lock is never
// held while the file is written.
class TrustStore {
public:
    explicit TrustStore(std::filesystem::path file);
    TrustStore(const TrustStore&) = delete;
    TrustStore& operator=(const TrustStore&) = delete;

    // Missing file means no paired hubs; a corrupt file is logged and ignored
    void Load();

    // Inserts or replaces the hub (token rotation on re-pairing) and persists
    void Add(AuthorizedHub hub);

    // True when the token belongs to the hub; refreshes last_seen
    bool Validate(const std::string& hub_id, const std::string& token);

    bool Revoke(const std::string& hub_id);

    std::optional<AuthorizedHub> Get(const std::string& hub_id) const;
    std::vector<AuthorizedHub> List() const;

    const std::filesystem::path& file() const { return file_; }

private:
    void persist();

    const std::filesystem::path file_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, AuthorizedHub> hubs_;
    std::mutex file_mutex_;
};

} // namespace deckhand::core
