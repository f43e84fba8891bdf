#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace deckhand::core {

struct AgentToken {
    std::string agent_id;
    std::string agent_name;
    std::string token;
    std::int64_t paired_at = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(AgentToken, agent_id, agent_name, token, paired_at)
};

// Hub side: tokens issued by agents plus the hub's own durable id, both kept in
// owner-only files under `dir`.
class TokenStore {
public:
    explicit TokenStore(std::filesystem::path dir);
    TokenStore(const TokenStore&) = delete;
    TokenStore& operator=(const TokenStore&) = delete;

    void Load();

    const std::string& hub_id() const { return hub_id_; }

    std::optional<std::string> Get(const std::string& agent_id) const;
    void Save(const std::string& agent_id, const std::string& agent_name, const std::string& token);
    bool Remove(const std::string& agent_id);
    std::vector<AgentToken> List() const;

private:
    void persist();

    const std::filesystem::path dir_;
    std::string hub_id_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, AgentToken> tokens_;
    std::mutex file_mutex_;
};

} // namespace deckhand::core
