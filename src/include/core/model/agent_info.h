#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace deckhand::core {

// What an Agent reports about itself over the health surface and the handshake
struct AgentInfo {
    std::string id;
    std::string name;
    std::string platform;
    std::string version;
    bool accept_connections = true;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(
        AgentInfo, id, name, platform, version, accept_connections)
};

// Advertised identity of an Agent on the local network
struct ServiceInfo {
    std::string id;
    std::string name;
    std::string platform;
    std::string version;
    std::uint16_t port = 0;
    std::vector<std::string> ips;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ServiceInfo, id, name, platform, version, port, ips)
};

struct DiscoveredAgent {
    ServiceInfo info;
    std::string host;
    std::uint16_t port = 0;
    std::vector<std::string> ips;
    std::chrono::steady_clock::time_point discovered_at;
    std::chrono::steady_clock::time_point last_seen;

    // first usable address, falls back to the advertised host name
    std::string Address() const { return ips.empty() ? host : ips.front(); }
};

} // namespace deckhand::core
