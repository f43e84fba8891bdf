#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <cli/argument_parser.h>
#include <cli/terminal.h>
#include <core/auth/identity.h>
#include <core/auth/pairing_manager.h>
#include <core/auth/trust_store.h>
#include <core/constant/path.h>
#include <core/constant/protocol.h>
#include <core/network/discovery/discovery_server.h>
#include <core/network/server/agent_context.h>
#include <core/network/server/agent_server.h>
#include <core/steam/steam_paths.h>
#include <core/transfer/upload_manager.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <core/util/system.h>
#include <format>
#include <iostream>

using namespace deckhand;
using namespace deckhand::core;
namespace net = boost::asio;

namespace {

int listHubs(TrustStore& store) {
    auto hubs = store.List();
    if (hubs.empty()) {
        std::cout << "No paired hubs" << std::endl;
        return 0;
    }
    for (const auto& hub : hubs) {
        std::cout << std::format("{} | {} | {} | paired {}",
                                 hub.hub_id,
                                 hub.name,
                                 hub.platform,
                                 hub.paired_at)
                  << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    cli::ArgumentParser parser(cli::Program::kAgent, argc, argv);
    cli::CliOptions options;
    try {
        options = parser.Parse();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        parser.ShowHelp();
        return 1;
    }
    if (options.show_help) {
        parser.ShowHelp();
        return 0;
    }

    Logger logger(LogProcess::kAgent,
                  options.log_level ? Logger::LevelFromString(*options.log_level)
                                    : Logger::DefaultLevel(LogProcess::kAgent),
                  path::kLogDir);

    if (options.config_path) {
        InitAgentConfig(*options.config_path);
        SaveAgentConfig(*options.config_path);
    } else {
        InitAgentConfig();
        SaveAgentConfig();
    }
    // command line overrides are not persisted
    if (options.name) {
        agent_settings.name = *options.name;
    }
    if (options.port) {
        agent_settings.port = *options.port;
    }

    TrustStore trust_store(path::kAgentDataDir / "trusted_hubs.json");
    trust_store.Load();

    if (options.list_hubs) {
        return listHubs(trust_store);
    }
    if (options.revoke_hub) {
        if (!trust_store.Revoke(*options.revoke_hub)) {
            std::cerr << "No paired hub with id " << *options.revoke_hub << std::endl;
            return 1;
        }
        std::cout << "Revoked " << *options.revoke_hub << std::endl;
        return 0;
    }

    std::string agent_id;
    try {
        agent_id = LoadOrCreateIdentity(path::kAgentDataDir / "agent_id");
    } catch (const std::exception& e) {
        spdlog::critical("Cannot load the agent identity: {}", e.what());
        return 1;
    }

    cli::Terminal terminal;
    PairingManager pairing(trust_store);
    pairing.SetCodeCallback(
        [&terminal](const std::string& code, const std::string& hub_name, std::chrono::seconds expires_in) {
            terminal.PrintInfo(std::format("Pairing request from {}", hub_name));
            terminal.PrintLine(std::format("\n    Pairing code: {}\n", code));
            terminal.PrintInfo(std::format("The code expires in {} seconds", expires_in.count()));
        });

    UploadManager uploads(agent_settings.install_dir, agent_settings.chunk_size);

    auto steam = agent_settings.steam_root.empty() ? SteamPaths::Detect()
                                                   : std::optional<SteamPaths>(
                                                         SteamPaths(agent_settings.steam_root));
    if (steam) {
        spdlog::info("Steam found at {}", steam->root().string());
    } else {
        spdlog::warn("Steam not found, shortcut operations are unavailable");
    }

    AgentContext context{
        .info = AgentInfo{
            .id = agent_id,
            .name = agent_settings.name,
            .platform = system::Platform(),
            .version = std::string(kAppVersion),
            .accept_connections = agent_settings.accept_connections,
        },
        .uploads = uploads,
        .pairing = pairing,
        .steam = steam,
    };

    net::io_context ioc;
    AgentServer server(ioc, context);
    if (!server.Start(agent_settings.port)) {
        spdlog::critical("Cannot listen on port {}", agent_settings.port);
        return 1;
    }

    DiscoveryServer discovery(ioc,
                              ServiceInfo{
                                  .id = agent_id,
                                  .name = agent_settings.name,
                                  .platform = context.info.platform,
                                  .version = context.info.version,
                                  .port = server.port(),
                              });
    if (!discovery.Start()) {
        spdlog::warn("mDNS advertisement unavailable, hubs will not discover this agent");
    }

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) {
            return;
        }
        spdlog::info("Shutting down");
        discovery.Stop();
        server.Stop();
        ioc.stop();
    });

    spdlog::info("deckhand agent {} '{}' ({}) listening on port {}, installing to {}",
                 kAppVersion,
                 agent_settings.name,
                 agent_id,
                 server.port(),
                 agent_settings.install_dir.string());

    ioc.run();
    return 0;
}
