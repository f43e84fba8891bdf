#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <cli/argument_parser.h>
#include <cli/hub_commands.h>
#include <cli/terminal.h>
#include <core/auth/token_store.h>
#include <core/constant/path.h>
#include <core/network/discovery/discovery_client.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <format>
#include <iostream>
#include <stop_token>
#include <thread>

using namespace deckhand;
using namespace deckhand::core;
namespace net = boost::asio;

int main(int argc, char* argv[]) {
    cli::ArgumentParser parser(cli::Program::kHub, argc, argv);
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

    Logger logger(LogProcess::kHub,
                  options.log_level ? Logger::LevelFromString(*options.log_level)
                                    : Logger::DefaultLevel(LogProcess::kHub),
                  path::kLogDir);

    if (options.config_path) {
        InitHubConfig(*options.config_path);
        SaveHubConfig(*options.config_path);
    } else {
        InitHubConfig();
        SaveHubConfig();
    }
    if (options.name) {
        hub_settings.name = *options.name;
    }

    TokenStore tokens(path::kHubDataDir);
    try {
        tokens.Load();
    } catch (const std::exception& e) {
        spdlog::critical("Cannot load the hub identity: {}", e.what());
        return 1;
    }

    net::io_context ioc;
    auto work = net::make_work_guard(ioc);
    std::jthread io_thread([&ioc]() {
        try {
            ioc.run();
        } catch (const std::exception& e) {
            spdlog::error("IO thread exception: {}", e.what());
        }
    });

    DiscoveryClient discovery(std::make_unique<MdnsBrowser>(ioc.get_executor()),
                              hub_settings.stale_timeout);
    cli::Terminal terminal;
    cli::HubCommands commands(ioc, tokens, discovery, terminal);

    int exit_code = 0;
    if (options.command) {
        exit_code = commands.Execute(*options.command, options.command_args);
    } else {
        // agents coming and going are reported while the prompt is open
        std::stop_source stop;
        net::co_spawn(ioc,
                      discovery.StartContinuousDiscovery(hub_settings.browse_interval,
                                                         stop.get_token(),
                                                         hub_settings.browse_timeout),
                      net::detached);
        std::jthread event_printer([&discovery, &terminal](std::stop_token token) {
            while (!token.stop_requested()) {
                auto event = discovery.events().WaitPop(std::chrono::milliseconds(500));
                if (!event || event->type == DiscoveryEventType::kUpdated) {
                    continue;
                }
                terminal.PrintInfo(std::format("agent {} {} ({})",
                                               event->agent.info.name,
                                               event->type == DiscoveryEventType::kDiscovered
                                                   ? "appeared"
                                                   : "lost",
                                               event->agent.info.id));
            }
        });

        commands.RunInteractive();
        stop.request_stop();
    }

    work.reset();
    ioc.stop();
    io_thread.join();
    return exit_code;
}
