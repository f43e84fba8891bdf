#include <chrono>
#include <core/auth/identity.h>
#include <core/auth/token_store.h>
#include <core/util/private_file.h>
#include <spdlog/spdlog.h>

namespace deckhand::core {

using json = nlohmann::json;

namespace {

constexpr auto kTokensFile = "tokens.json";
constexpr auto kHubIdFile = "hub_id";

} // namespace

TokenStore::TokenStore(std::filesystem::path dir)
    : dir_(std::move(dir)) {}

void TokenStore::Load() {
    hub_id_ = LoadOrCreateIdentity(dir_ / kHubIdFile);

    auto content = ReadTextFile(dir_ / kTokensFile);
    std::unique_lock lock(mutex_);
    tokens_.clear();
    if (!content) {
        return;
    }
    try {
        for (auto token : json::parse(*content).get<std::vector<AgentToken>>()) {
            tokens_[token.agent_id] = std::move(token);
        }
    } catch (const json::exception& e) {
        tokens_.clear();
        spdlog::error("Failed to parse {}: {}", (dir_ / kTokensFile).string(), e.what());
        try {
            spdlog::warn("Unreadable token file kept as {}", MoveAside(dir_ / kTokensFile).string());
        } catch (const std::filesystem::filesystem_error& moved) {
            spdlog::error("Failed to move the token file aside: {}", moved.what());
        }
    }
}

std::optional<std::string> TokenStore::Get(const std::string& agent_id) const {
    std::shared_lock lock(mutex_);
    auto it = tokens_.find(agent_id);
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second.token;
}

void TokenStore::Save(const std::string& agent_id,
                      const std::string& agent_name,
                      const std::string& token) {
    {
        std::unique_lock lock(mutex_);
        tokens_[agent_id] = AgentToken{
            agent_id,
            agent_name,
            token,
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count(),
        };
    }
    persist();
}

bool TokenStore::Remove(const std::string& agent_id) {
    {
        std::unique_lock lock(mutex_);
        if (tokens_.erase(agent_id) == 0) {
            return false;
        }
    }
    persist();
    return true;
}

std::vector<AgentToken> TokenStore::List() const {
    std::shared_lock lock(mutex_);
    std::vector<AgentToken> tokens;
    for (const auto& [id, token] : tokens_) {
        tokens.push_back(token);
    }
    return tokens;
}

void TokenStore::persist() {
    std::lock_guard<std::mutex> file_lock(file_mutex_);
    json j = List();
    WritePrivateFile(dir_ / kTokensFile, j.dump(2));
}

} // namespace deckhand::core
