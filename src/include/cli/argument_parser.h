#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace deckhand::cli {

enum class Program {
    kAgent,
    kHub,
};

struct CliOptions {
    std::optional<uint16_t> port;
    std::optional<std::string> config_path;
    std::optional<std::string> name;
    std::optional<std::string> log_level;
    bool show_help = false;

    // agent only
    bool list_hubs = false;
    std::optional<std::string> revoke_hub;

    // hub only
    std::optional<std::string> command;
    std::vector<std::string> command_args;
};

class ArgumentParser {
public:
    ArgumentParser(Program program, int argc, char* argv[]);

    // Throws std::runtime_error for unknown options, missing values and
    // out-of-range settings
    CliOptions Parse();

    void ShowHelp() const;

    // Arguments each hub command expects, nullopt for an unknown command
    static std::optional<std::size_t> CommandArity(const std::string& command);

private:
    void parseOptions(const std::string& arg, CliOptions& options);
    void parseCommand(CliOptions& options);
    std::string nextValue(const std::string& what);

    void validateOptions(const CliOptions& options) const;

    Program program_;
    int argc_;
    char** argv_;
    int i; // index of the argument being parsed
};

} // namespace deckhand::cli
