#include <core/constant/path.h>
#include <core/constant/protocol.h>
#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <core/util/system.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace deckhand::core {

namespace {

toml::table agent_config;
toml::table hub_config;

toml::table loadTable(const std::filesystem::path& file) {
    if (!std::filesystem::exists(file.parent_path())) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(file.parent_path());
    }
    if (!std::filesystem::exists(file)) {
        std::ofstream ofs(file);
        spdlog::info("Config file does not exist, creating...");
    }
    try {
        return toml::parse_file(file.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", file.string(), err.description());
        return toml::table{};
    }
}

toml::table& section(toml::table& config, std::string_view name) {
    if (!config.contains(name)) {
        config.insert(name, toml::table{});
    }
    return *config[name].as_table();
}

void writeTable(const std::filesystem::path& file, const toml::table& config) {
    std::filesystem::create_directories(file.parent_path());
    std::ofstream ofs(file);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", file.string());
        return;
    }
    ofs << config;
}

std::chrono::seconds secondsOr(toml::table& table, std::string_view key, std::chrono::seconds def) {
    return std::chrono::seconds(table[key].value_or(static_cast<std::int64_t>(def.count())));
}

} // namespace

void InitAgentConfig(const std::filesystem::path& file) {
    agent_config = loadTable(file);
    auto& setting = section(agent_config, "agent");

    agent_settings.name = setting["name"].value_or(system::Hostname());
    agent_settings.port = static_cast<std::uint16_t>(
        setting["port"].value_or(static_cast<std::int64_t>(discovery::kDefaultPort)));
    agent_settings.install_dir = setting["install-dir"].value_or(
        path::kDefaultInstallDir.string());
    agent_settings.steam_root = setting["steam-root"].value_or(std::string{});
    agent_settings.accept_connections = setting["accept-connections"].value_or(true);
    agent_settings.chunk_size = setting["chunk-size"].value_or(
        static_cast<std::int64_t>(transfer::kDefaultChunkSize));
    if (agent_settings.chunk_size == 0 || agent_settings.chunk_size > transfer::kMaxChunkSize) {
        spdlog::warn("chunk-size {} out of range, using {}",
                     agent_settings.chunk_size,
                     transfer::kDefaultChunkSize);
        agent_settings.chunk_size = transfer::kDefaultChunkSize;
    }
    agent_settings.verbose = setting["verbose"].value_or(false);
}

void SaveAgentConfig(const std::filesystem::path& file) {
    agent_config.insert_or_assign("agent",
                                  toml::table{
                                      {"name", agent_settings.name},
                                      {"port", agent_settings.port},
                                      {"install-dir", agent_settings.install_dir.string()},
                                      {"steam-root", agent_settings.steam_root.string()},
                                      {"accept-connections", agent_settings.accept_connections},
                                      {"chunk-size",
                                       static_cast<std::int64_t>(agent_settings.chunk_size)},
                                      {"verbose", agent_settings.verbose},
                                  });
    writeTable(file, agent_config);
}

void InitHubConfig(const std::filesystem::path& file) {
    hub_config = loadTable(file);
    auto& setting = section(hub_config, "hub");

    hub_settings.name = setting["name"].value_or(system::Hostname());
    hub_settings.browse_timeout = secondsOr(setting, "browse-timeout", discovery::kBrowseTimeout);
    hub_settings.browse_interval = secondsOr(setting, "browse-interval", discovery::kBrowseInterval);
    hub_settings.stale_timeout = secondsOr(setting, "stale-timeout", discovery::kStaleTimeout);
    hub_settings.request_timeout = secondsOr(setting, "request-timeout", protocol::kRequestTimeout);
}

void SaveHubConfig(const std::filesystem::path& file) {
    hub_config.insert_or_assign(
        "hub",
        toml::table{
            {"name", hub_settings.name},
            {"browse-timeout", static_cast<std::int64_t>(hub_settings.browse_timeout.count())},
            {"browse-interval", static_cast<std::int64_t>(hub_settings.browse_interval.count())},
            {"stale-timeout", static_cast<std::int64_t>(hub_settings.stale_timeout.count())},
            {"request-timeout", static_cast<std::int64_t>(hub_settings.request_timeout.count())},
        });
    writeTable(file, hub_config);
}

void InitAgentConfig() {
    InitAgentConfig(path::kAgentDataDir / "config.toml");
}

void SaveAgentConfig() {
    SaveAgentConfig(path::kAgentDataDir / "config.toml");
}

void InitHubConfig() {
    InitHubConfig(path::kHubDataDir / "config.toml");
}

void SaveHubConfig() {
    SaveHubConfig(path::kHubDataDir / "config.toml");
}

} // namespace deckhand::core
