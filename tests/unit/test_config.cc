#include "../test_helpers.h"
#include <catch2/catch_test_macros.hpp>
#include <core/constant/protocol.h>
#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <fstream>

using namespace deckhand::core;
using deckhand::test::TempDir;

namespace {

void writeText(const std::filesystem::path& file, const std::string& text) {
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file);
    out << text;
}

} // namespace

TEST_CASE("Agent config falls back to defaults", "[config]") {
    TempDir dir;
    auto file = dir / "agent/config.toml";

    InitAgentConfig(file);

    REQUIRE(std::filesystem::exists(file));
    REQUIRE_FALSE(agent_settings.name.empty());
    REQUIRE(agent_settings.port == discovery::kDefaultPort);
    REQUIRE(agent_settings.accept_connections);
    REQUIRE(agent_settings.chunk_size == transfer::kDefaultChunkSize);
    REQUIRE_FALSE(agent_settings.verbose);
}

TEST_CASE("Agent config reads and saves its table", "[config]") {
    TempDir dir;
    auto file = dir / "config.toml";
    writeText(file,
              "[agent]\n"
              "name = \"Living Room\"\n"
              "port = 9100\n"
              "install-dir = \"/games\"\n"
              "accept-connections = false\n"
              "chunk-size = 65536\n");

    InitAgentConfig(file);
    REQUIRE(agent_settings.name == "Living Room");
    REQUIRE(agent_settings.port == 9100);
    REQUIRE(agent_settings.install_dir == "/games");
    REQUIRE_FALSE(agent_settings.accept_connections);
    REQUIRE(agent_settings.chunk_size == 65536);

    agent_settings.name = "Bedroom";
    SaveAgentConfig(file);
    agent_settings.name.clear();

    InitAgentConfig(file);
    REQUIRE(agent_settings.name == "Bedroom");
    REQUIRE(agent_settings.port == 9100);
}

TEST_CASE("Agent config rejects an unusable chunk size", "[config]") {
    TempDir dir;
    auto file = dir / "config.toml";

    SECTION("zero") {
        writeText(file, "[agent]\nchunk-size = 0\n");
    }
    SECTION("above the maximum") {
        writeText(file, "[agent]\nchunk-size = 1073741824\n");
    }

    InitAgentConfig(file);
    REQUIRE(agent_settings.chunk_size == transfer::kDefaultChunkSize);
}

TEST_CASE("A config file that does not parse yields defaults", "[config]") {
    TempDir dir;
    auto file = dir / "config.toml";
    writeText(file, "[agent\nport = = 3\n");

    InitAgentConfig(file);
    REQUIRE(agent_settings.port == discovery::kDefaultPort);
}

TEST_CASE("Hub config stores timeouts in seconds", "[config]") {
    TempDir dir;
    auto file = dir / "hub.toml";
    writeText(file, "[hub]\nname = \"desk\"\nbrowse-timeout = 5\n");

    InitHubConfig(file);
    REQUIRE(hub_settings.name == "desk");
    REQUIRE(hub_settings.browse_timeout == std::chrono::seconds(5));
    REQUIRE(hub_settings.stale_timeout == discovery::kStaleTimeout);
    REQUIRE(hub_settings.request_timeout == protocol::kRequestTimeout);

    hub_settings.stale_timeout = std::chrono::seconds(300);
    SaveHubConfig(file);
    InitHubConfig(file);
    REQUIRE(hub_settings.stale_timeout == std::chrono::seconds(300));
}
