#include <chrono>
#include <cli/argument_parser.h>
#include <cli/hub_commands.h>
#include <core/auth/pairing_manager.h>
#include <core/constant/protocol.h>
#include <core/transfer/upload_sender.h>
#include <core/util/config.h>
#include <core/util/system.h>
#include <format>
#include <future>
#include <sstream>
#include <stdexcept>

namespace net = boost::asio;

namespace deckhand::cli {

using namespace core;

HubCommands::HubCommands(net::io_context& io_context,
                         TokenStore& tokens,
                         DiscoveryClient& discovery,
                         Terminal& terminal)
    : io_context_(io_context)
    , tokens_(tokens)
    , discovery_(discovery)
    , terminal_(terminal) {}

int HubCommands::Execute(const std::string& command, const std::vector<std::string>& args) {
    try {
        if (command == "discover") {
            discover();
        } else if (command == "pair") {
            pair(args.at(0));
        } else if (command == "info") {
            info(args.at(0));
        } else if (command == "shortcuts") {
            shortcuts(args.at(0), args.at(1));
        } else if (command == "deploy") {
            deploy(args.at(0), args.at(1), args.at(2), args.at(3));
        } else if (command == "revoke") {
            revoke(args.at(0));
        } else if (command == "help") {
            printHelp();
        } else {
            terminal_.PrintError("unknown command: " + command);
            return 1;
        }
    } catch (const PairingError& e) {
        terminal_.PrintError(std::format("pairing failed ({}): {}", e.reason_string(), e.what()));
        return 1;
    } catch (const RemoteError& e) {
        terminal_.PrintError(std::format("agent refused the request: {}", e.what()));
        return 1;
    } catch (const std::exception& e) {
        terminal_.PrintError(e.what());
        return 1;
    }
    return 0;
}

void HubCommands::RunInteractive() {
    terminal_.PrintInfo("Type 'help' for the list of commands, 'exit' to quit");
    while (true) {
        terminal_.PrintPrompt();
        auto line = terminal_.ReadLine();
        if (!line) {
            break;
        }
        std::vector<std::string> args;
        std::istringstream iss(*line);
        std::string arg;
        while (iss >> arg) {
            args.push_back(arg);
        }
        if (args.empty()) {
            continue;
        }
        auto command = args.front();
        args.erase(args.begin());
        if (command == "exit" || command == "quit") {
            break;
        }
        auto arity = ArgumentParser::CommandArity(command);
        if (!arity) {
            terminal_.PrintError("unknown command: " + command);
            continue;
        }
        if (args.size() != *arity) {
            terminal_.PrintError(std::format("{} takes {} argument(s)", command, *arity));
            continue;
        }
        Execute(command, args);
    }
}

void HubCommands::discover() {
    auto agents = run([this] { return discovery_.Discover(hub_settings.browse_timeout); });
    if (agents.empty()) {
        terminal_.PrintInfo("no agents found");
        return;
    }
    terminal_.PrintInfo(std::format("{} agent(s) found:", agents.size()));
    for (const auto& agent : agents) {
        auto paired = tokens_.Get(agent.info.id).has_value();
        terminal_.PrintLine(std::format("  {} | {} | {}:{} | {}{}",
                                        agent.info.id,
                                        agent.info.name,
                                        agent.Address(),
                                        agent.port,
                                        agent.info.platform,
                                        paired ? " | paired" : ""));
    }
}

void HubCommands::pair(const std::string& key) {
    auto agent = resolve(key);
    auto client = makeClient();
    auto host = agent.Address();
    auto result = run([&] { return client->Connect(host, agent.port, std::string{}); });

    switch (result.state) {
    case ConnectState::kConnected:
        terminal_.PrintInfo("already trusted by " + result.agent.name);
        break;
    case ConnectState::kPairFailed:
        terminal_.PrintError("agent refused pairing: " + result.reason);
        break;
    case ConnectState::kPairingRequired: {
        auto code = terminal_.Ask(std::format("Enter the code shown on {} (expires in {}s): ",
                                              agent.info.name,
                                              result.expires_in));
        if (!code) {
            break;
        }
        auto success = run([&] { return client->ConfirmPairing(*code); });
        tokens_.Save(success.agent_id, agent.info.name, success.token);
        terminal_.PrintSuccess("paired with " + agent.info.name);
        break;
    }
    }
    client->Close();
}

void HubCommands::info(const std::string& key) {
    auto client = connect(resolve(key));
    auto agent = run([&] { return client->GetInfo(); });
    terminal_.PrintLine(std::format("id:       {}", agent.id));
    terminal_.PrintLine(std::format("name:     {}", agent.name));
    terminal_.PrintLine(std::format("platform: {}", agent.platform));
    terminal_.PrintLine(std::format("version:  {}", agent.version));

    try {
        auto users = run([&] { return client->GetSteamUsers(); });
        terminal_.PrintLine(std::format("steam users: {}", users.size()));
        for (const auto& user : users) {
            terminal_.PrintLine("  " + user.id);
        }
    } catch (const RemoteError& e) {
        if (e.code() != static_cast<int>(ErrorCode::kNotFound)) {
            throw;
        }
        terminal_.PrintLine("steam: not installed");
    }
    client->Close();
}

void HubCommands::shortcuts(const std::string& key, const std::string& user_id) {
    auto client = connect(resolve(key));
    auto response = run([&] { return client->ListShortcuts(user_id); });
    if (!response.warning.empty()) {
        terminal_.PrintError(response.warning);
    }
    terminal_.PrintInfo(std::format("{} shortcut(s):", response.shortcuts.size()));
    for (const auto& shortcut : response.shortcuts) {
        terminal_.PrintLine(std::format("  {:>10} | {} | {}", shortcut.app_id, shortcut.name, shortcut.exe));
    }
    client->Close();
}

void HubCommands::deploy(const std::string& key,
                         const std::string& dir,
                         const std::string& name,
                         const std::string& exe) {
    auto client = connect(resolve(key));

    UploadOptions options;
    options.config.game_name = name;
    options.config.executable = exe;
    try {
        auto users = run([&] { return client->GetSteamUsers(); });
        if (!users.empty()) {
            options.create_shortcut = true;
            options.user_id = users.front().id;
        }
    } catch (const RemoteError& e) {
        if (e.code() != static_cast<int>(ErrorCode::kNotFound)) {
            throw;
        }
        terminal_.PrintInfo("Steam not found on the agent, no shortcut will be created");
    }

    EventQueue<UploadProgress> progress(64);
    UploadSender sender(*client, &progress);
    std::filesystem::path root(dir);
    auto future = net::co_spawn(io_context_,
                                [&] { return sender.Upload(root, options); },
                                net::use_future);
    while (future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        if (auto update = progress.WaitPop(std::chrono::milliseconds(200))) {
            progress_display_.UpdateProgress(*update);
        }
    }
    progress_display_.ClearProgress();
    auto result = future.get();
    client->Close();

    if (result.status == UploadStatus::kCancelled) {
        terminal_.PrintInfo("upload cancelled");
        return;
    }
    terminal_.PrintSuccess(std::format("uploaded {} to {} ({} sent, {} already present)",
                                       name,
                                       result.completion.path,
                                       ProgressDisplay::FormatBytes(static_cast<double>(result.bytes_sent)),
                                       ProgressDisplay::FormatBytes(static_cast<double>(result.bytes_resumed))));
    if (result.completion.shortcut_created) {
        terminal_.PrintSuccess(std::format("shortcut created, app id {}", result.completion.app_id));
    }
    if (!result.completion.finalize_error.empty()) {
        terminal_.PrintError("finalize failed: " + result.completion.finalize_error);
    }
}

void HubCommands::revoke(const std::string& key) {
    std::string agent_id = key;
    for (const auto& token : tokens_.List()) {
        if (token.agent_name == key) {
            agent_id = token.agent_id;
            break;
        }
    }
    if (tokens_.Remove(agent_id)) {
        terminal_.PrintSuccess("forgot the token for " + key);
    } else {
        terminal_.PrintError("not paired with " + key);
    }
}

void HubCommands::printHelp() {
    terminal_.PrintInfo("Available commands are as follows:");
    terminal_.PrintInfo("  discover - List agents on the network");
    terminal_.PrintInfo("  pair <agent> - Pair with an agent, the code is shown on the agent");
    terminal_.PrintInfo("  info <agent> - Show agent details and Steam users");
    terminal_.PrintInfo("  shortcuts <agent> <user> - List a user's shortcuts");
    terminal_.PrintInfo("  deploy <agent> <dir> <name> <exe> - Upload a game and add a shortcut");
    terminal_.PrintInfo("  revoke <agent> - Forget an agent's token");
    terminal_.PrintInfo("  exit/quit - Exit the program");
}

DiscoveredAgent HubCommands::resolve(const std::string& key) {
    auto find = [&]() -> std::optional<DiscoveredAgent> {
        if (auto agent = discovery_.GetAgent(key)) {
            return agent;
        }
        for (auto& agent : discovery_.Agents()) {
            if (agent.info.name == key) {
                return agent;
            }
        }
        return std::nullopt;
    };

    if (auto agent = find()) {
        return *agent;
    }
    run([this] { return discovery_.Discover(hub_settings.browse_timeout); });
    if (auto agent = find()) {
        return *agent;
    }
    throw std::runtime_error("agent not found: " + key);
}

std::shared_ptr<AgentClient> HubCommands::makeClient() const {
    HubConnectedRequest hello;
    hello.name = hub_settings.name;
    hello.version = std::string(kAppVersion);
    hello.platform = system::Platform();
    hello.hub_id = tokens_.hub_id();
    return std::make_shared<AgentClient>(io_context_.get_executor(), std::move(hello));
}

std::shared_ptr<AgentClient> HubCommands::connect(const DiscoveredAgent& agent) {
    auto token = tokens_.Get(agent.info.id);
    if (!token) {
        throw std::runtime_error(std::format("not paired with {}, run 'pair {}' first",
                                             agent.info.name,
                                             agent.info.id));
    }
    auto client = makeClient();
    auto host = agent.Address();
    auto result = run([&] { return client->Connect(host, agent.port, *token); });
    if (result.state != ConnectState::kConnected) {
        client->Close();
        if (result.state == ConnectState::kPairingRequired) {
            throw std::runtime_error(std::format("{} no longer trusts this hub, run 'pair {}' again",
                                                 agent.info.name,
                                                 agent.info.id));
        }
        throw std::runtime_error("agent refused the connection: " + result.reason);
    }
    return client;
}

} // namespace deckhand::cli
