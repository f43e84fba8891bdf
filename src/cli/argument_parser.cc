#include <algorithm>
#include <cli/argument_parser.h>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace deckhand::cli {

namespace {

const std::unordered_map<std::string, std::size_t> kCommandArity = {
    {"discover", 0},
    {"pair", 1},
    {"info", 1},
    {"shortcuts", 2},
    {"deploy", 4},
    {"revoke", 1},
    {"help", 0},
};

} // namespace

ArgumentParser::ArgumentParser(Program program, int argc, char* argv[])
    : program_(program)
    , argc_(argc)
    , argv_(argv)
    , i(1) {}

CliOptions ArgumentParser::Parse() {
    CliOptions options;

    while (i < argc_) {
        std::string arg = argv_[i];

        if (arg.empty() || arg[0] != '-') {
            if (program_ != Program::kHub) {
                throw std::runtime_error("Unexpected argument: " + arg);
            }
            parseCommand(options);
            break;
        }

        parseOptions(arg, options);
        i++;
    }

    validateOptions(options);
    return options;
}

std::string ArgumentParser::nextValue(const std::string& what) {
    if (++i >= argc_) {
        throw std::runtime_error("Missing " + what);
    }
    return argv_[i];
}

void ArgumentParser::parseOptions(const std::string& arg, CliOptions& options) {
    if (arg == "-c" || arg == "--config") {
        options.config_path = nextValue("config path");
    } else if (arg == "-l" || arg == "--log-level") {
        options.log_level = nextValue("log level");
    } else if (arg == "-n" || arg == "--name") {
        options.name = nextValue("name");
    } else if (arg == "-h" || arg == "--help") {
        options.show_help = true;
    } else if (program_ == Program::kAgent && (arg == "-p" || arg == "--port")) {
        auto value = nextValue("port number");
        int port = 0;
        try {
            port = std::stoi(value);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid port number: " + value);
        }
        if (port < 1024 || port > 65535) {
            throw std::runtime_error("Port must be between 1024 and 65535");
        }
        options.port = static_cast<uint16_t>(port);
    } else if (program_ == Program::kAgent && arg == "--list-hubs") {
        options.list_hubs = true;
    } else if (program_ == Program::kAgent && arg == "--revoke") {
        options.revoke_hub = nextValue("hub id");
    } else {
        throw std::runtime_error("Unknown option: " + arg);
    }
}

void ArgumentParser::parseCommand(CliOptions& options) {
    if (i >= argc_) {
        return;
    }

    options.command = argv_[i++];

    while (i < argc_) {
        options.command_args.push_back(argv_[i++]);
    }
}

std::optional<std::size_t> ArgumentParser::CommandArity(const std::string& command) {
    auto it = kCommandArity.find(command);
    if (it == kCommandArity.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ArgumentParser::validateOptions(const CliOptions& options) const {
    if (options.log_level) {
        std::string level = *options.log_level;
        std::transform(level.begin(), level.end(), level.begin(), ::tolower);
        if (level != "debug" && level != "info" && level != "warning" && level != "error") {
            throw std::runtime_error("Invalid log level: " + *options.log_level);
        }
    }

    if (options.command) {
        auto arity = CommandArity(*options.command);
        if (!arity) {
            throw std::runtime_error("Unknown command: " + *options.command);
        }
        if (options.command_args.size() != *arity) {
            throw std::runtime_error("Wrong number of arguments for " + *options.command);
        }
    }
}

void ArgumentParser::ShowHelp() const {
    if (program_ == Program::kAgent) {
        std::cout << "Usage: deckhand-agent [options]\n\n"
                  << "Options:\n"
                  << "  -p, --port PORT      Set server port (default: 8765)\n"
                  << "  -n, --name NAME      Set the advertised name\n"
                  << "  -c, --config PATH    Set config file path\n"
                  << "  -l, --log-level LVL  Set log level (debug|info|warning|error)\n"
                  << "      --list-hubs      List paired hubs and exit\n"
                  << "      --revoke HUB_ID  Revoke a paired hub and exit\n"
                  << "  -h, --help           Show this help message\n";
        return;
    }
    std::cout << "Usage: deckhand-hub [options] [command] [args...]\n\n"
              << "Options:\n"
              << "  -n, --name NAME      Set the name shown to agents\n"
              << "  -c, --config PATH    Set config file path\n"
              << "  -l, --log-level LVL  Set log level (debug|info|warning|error)\n"
              << "  -h, --help           Show this help message\n\n"
              << "Commands (interactive mode without one):\n"
              << "  discover                          List agents on the network\n"
              << "  pair AGENT                        Pair with an agent\n"
              << "  info AGENT                        Show agent details and Steam users\n"
              << "  shortcuts AGENT USER              List a user's shortcuts\n"
              << "  deploy AGENT DIR NAME EXE         Upload a game and add a shortcut\n"
              << "  revoke AGENT                      Forget an agent's token\n"
              << "  help                              Show help message\n";
}

} // namespace deckhand::cli
