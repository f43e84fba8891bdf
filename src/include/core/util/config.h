/*
    config.h
    Configuration of the agent and the hub, stored as TOML.

    Example usage:

    - Read a setting:
        std::uint16_t port = deckhand::core::agent_settings.port;
    - Write a setting:
        deckhand::core::agent_settings.name = "Living Room Deck";

    Initialization and saving:
    - Load the configuration (creates the file with defaults when missing):
        deckhand::core::InitAgentConfig();
    - Save the current configuration to file:
        deckhand::core::SaveAgentConfig();

    The Init and Save functions taking a path are the same operations on an
    explicit file and are what the tests use.
*/

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <toml++/toml.h>

namespace deckhand::core {

struct AgentSettings {
    std::string name;                   // Display name, hostname when empty
    std::uint16_t port;                 // Listen port, 0 for an ephemeral one
    std::filesystem::path install_dir;  // Where uploaded games are written
    std::filesystem::path steam_root;   // Detected when empty
    bool accept_connections;            // Refuse every hub session when false
    std::uint64_t chunk_size;           // Chunk size dictated to hubs
    bool verbose;                       // Log every chunk
};

struct HubSettings {
    std::string name;
    std::chrono::seconds browse_timeout;
    std::chrono::seconds browse_interval;
    std::chrono::seconds stale_timeout;
    std::chrono::seconds request_timeout;
};

inline AgentSettings agent_settings;
inline HubSettings hub_settings;

void InitAgentConfig();
void SaveAgentConfig();
void InitHubConfig();
void SaveHubConfig();

void InitAgentConfig(const std::filesystem::path& file);
void SaveAgentConfig(const std::filesystem::path& file);
void InitHubConfig(const std::filesystem::path& file);
void SaveHubConfig(const std::filesystem::path& file);

} // namespace deckhand::core
