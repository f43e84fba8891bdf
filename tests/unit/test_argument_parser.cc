#include <catch2/catch_test_macros.hpp>
#include <cli/argument_parser.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace deckhand::cli;

namespace {

// Keeps the argv strings alive for the parser
class Args {
public:
    explicit Args(std::vector<std::string> args)
        : storage_(std::move(args)) {
        for (auto& arg : storage_) {
            argv_.push_back(arg.data());
        }
    }

    int argc() const { return static_cast<int>(argv_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

CliOptions parse(Program program, std::vector<std::string> args) {
    Args holder(std::move(args));
    ArgumentParser parser(program, holder.argc(), holder.argv());
    return parser.Parse();
}

} // namespace

TEST_CASE("Agent options are parsed", "[cli]") {
    auto options = parse(Program::kAgent,
                         {"deckhand-agent", "-p", "9000", "--name", "Deck-1", "-l", "debug"});
    REQUIRE(options.port == 9000);
    REQUIRE(options.name == "Deck-1");
    REQUIRE(options.log_level == "debug");
    REQUIRE_FALSE(options.show_help);

    auto revoke = parse(Program::kAgent, {"deckhand-agent", "--revoke", "hub-1"});
    REQUIRE(revoke.revoke_hub == "hub-1");

    REQUIRE(parse(Program::kAgent, {"deckhand-agent", "--list-hubs"}).list_hubs);
}

TEST_CASE("Agent options are validated", "[cli]") {
    REQUIRE_THROWS_AS(parse(Program::kAgent, {"deckhand-agent", "-p", "80"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse(Program::kAgent, {"deckhand-agent", "-p", "port"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse(Program::kAgent, {"deckhand-agent", "--name"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse(Program::kAgent, {"deckhand-agent", "-l", "loud"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse(Program::kAgent, {"deckhand-agent", "deploy"}), std::runtime_error);
}

TEST_CASE("Hub commands take their arguments", "[cli]") {
    auto options = parse(Program::kHub,
                         {"deckhand-hub", "-n", "desk", "deploy", "a1", "./game", "Hollow Quest", "run.sh"});
    REQUIRE(options.name == "desk");
    REQUIRE(options.command == "deploy");
    REQUIRE(options.command_args == std::vector<std::string>{"a1", "./game", "Hollow Quest", "run.sh"});

    REQUIRE_FALSE(parse(Program::kHub, {"deckhand-hub"}).command);

    REQUIRE_THROWS_AS(parse(Program::kHub, {"deckhand-hub", "pair"}), std::runtime_error);
    REQUIRE_THROWS_AS(parse(Program::kHub, {"deckhand-hub", "launch", "a1"}), std::runtime_error);
    // agent-only options are unknown to the hub
    REQUIRE_THROWS_AS(parse(Program::kHub, {"deckhand-hub", "-p", "9000"}), std::runtime_error);
}

TEST_CASE("Command arity is known for every hub command", "[cli]") {
    REQUIRE(ArgumentParser::CommandArity("discover") == 0u);
    REQUIRE(ArgumentParser::CommandArity("shortcuts") == 2u);
    REQUIRE(ArgumentParser::CommandArity("deploy") == 4u);
    REQUIRE_FALSE(ArgumentParser::CommandArity("exit"));
}
