#include <algorithm>
#include <chrono>
#include <core/auth/trust_store.h>
#include <core/util/private_file.h>
#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <spdlog/spdlog.h>

namespace deckhand::core {

using json = nlohmann::json;

namespace {

std::int64_t unixNow() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

bool tokensEqual(const std::string& a, const std::string& b) {
    return a.size() == b.size() && !a.empty() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace

TrustStore::TrustStore(std::filesystem::path file)
    : file_(std::move(file)) {}

void TrustStore::Load() {
    auto content = ReadTextFile(file_);
    std::unique_lock lock(mutex_);
    hubs_.clear();
    if (!content) {
        return;
    }
    try {
        auto j = json::parse(*content);
        for (auto hub : j.value("hubs", std::vector<AuthorizedHub>{})) {
            hubs_[hub.hub_id] = std::move(hub);
        }
    } catch (const json::exception& e) {
        hubs_.clear();
        spdlog::error("Failed to parse trust store {}: {}", file_.string(), e.what());
        try {
            spdlog::warn("Unreadable trust store kept as {}", MoveAside(file_).string());
        } catch (const std::filesystem::filesystem_error& moved) {
            spdlog::error("Failed to move the trust store aside: {}", moved.what());
        }
    }
}

void TrustStore::Add(AuthorizedHub hub) {
    {
        std::unique_lock lock(mutex_);
        hubs_[hub.hub_id] = std::move(hub);
    }
    persist();
}

bool TrustStore::Validate(const std::string& hub_id, const std::string& token) {
    {
        std::unique_lock lock(mutex_);
        auto it = hubs_.find(hub_id);
        if (it == hubs_.end() || !tokensEqual(it->second.token, token)) {
            return false;
        }
        it->second.last_seen = unixNow();
    }
    try {
        persist();
    } catch (const std::exception& e) {
        // the token is valid even if last_seen could not be stored
        spdlog::warn("Failed to update last_seen for hub {}: {}", hub_id, e.what());
    }
    return true;
}

bool TrustStore::Revoke(const std::string& hub_id) {
    {
        std::unique_lock lock(mutex_);
        if (hubs_.erase(hub_id) == 0) {
            return false;
        }
    }
    persist();
    spdlog::info("Revoked hub {}", hub_id);
    return true;
}

std::optional<AuthorizedHub> TrustStore::Get(const std::string& hub_id) const {
    std::shared_lock lock(mutex_);
    auto it = hubs_.find(hub_id);
    if (it == hubs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AuthorizedHub> TrustStore::List() const {
    std::vector<AuthorizedHub> hubs;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, hub] : hubs_) {
            hubs.push_back(hub);
        }
    }
    std::sort(hubs.begin(), hubs.end(), [](const auto& a, const auto& b) {
        return a.paired_at < b.paired_at;
    });
    return hubs;
}

void TrustStore::persist() {
    std::lock_guard<std::mutex> file_lock(file_mutex_);
    json j{{"hubs", List()}};
    WritePrivateFile(file_, j.dump(2));
}

} // namespace deckhand::core
