#include "loopback_agent.h"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/constant/protocol.h>
#include <core/network/server/agent_server.h>
#include <optional>

using namespace deckhand::core;
using deckhand::test::LoopbackAgent;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

namespace {

struct UpgradeAttempt {
    std::optional<websocket::stream<beast::tcp_stream>> ws;
    http::status status = http::status::unknown;
    bool done = false;
};

net::awaitable<void> upgradeHub(std::uint16_t port, UpgradeAttempt& attempt) {
    auto executor = co_await net::this_coro::executor;
    attempt.ws.emplace(executor);
    co_await beast::get_lowest_layer(*attempt.ws)
        .async_connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port), net::use_awaitable);

    websocket::response_type response;
    boost::system::error_code ec;
    co_await attempt.ws->async_handshake(response,
                                         "127.0.0.1",
                                         std::string(protocol::kWebsocketPath),
                                         net::redirect_error(net::use_awaitable, ec));
    attempt.status = response.result();
    attempt.done = true;
}

// Runs the io_context until `ready` holds or a few seconds pass
template <typename Ready>
void runUntil(net::io_context& ioc, Ready ready) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!ready() && std::chrono::steady_clock::now() < deadline) {
        ioc.run_one_for(std::chrono::milliseconds(100));
    }
}

} // namespace

TEST_CASE("Only one of two hubs upgrading at once gets the session", "[server][session]") {
    LoopbackAgent agent;
    net::io_context ioc;
    AgentServer server(ioc, agent.context());
    REQUIRE(server.Start(0));

    UpgradeAttempt first;
    UpgradeAttempt second;
    net::co_spawn(ioc, upgradeHub(server.port(), first), net::detached);
    net::co_spawn(ioc, upgradeHub(server.port(), second), net::detached);
    runUntil(ioc, [&] { return first.done && second.done; });

    REQUIRE(first.done);
    REQUIRE(second.done);
    auto accepted = (first.status == http::status::switching_protocols ? 1 : 0)
                    + (second.status == http::status::switching_protocols ? 1 : 0);
    auto refused = (first.status == http::status::conflict ? 1 : 0)
                   + (second.status == http::status::conflict ? 1 : 0);
    REQUIRE(accepted == 1);
    REQUIRE(refused == 1);

    SECTION("the slot frees up once the connected hub leaves") {
        auto& winner = first.status == http::status::switching_protocols ? first : second;
        boost::system::error_code ec;
        beast::get_lowest_layer(*winner.ws).socket().close(ec);

        UpgradeAttempt third;
        for (int i = 0; i < 20 && third.status != http::status::switching_protocols; ++i) {
            third.ws.reset();
            third.status = http::status::unknown;
            third.done = false;
            net::co_spawn(ioc, upgradeHub(server.port(), third), net::detached);
            runUntil(ioc, [&] { return third.done; });
        }
        REQUIRE(third.status == http::status::switching_protocols);
        third.ws.reset();
    }

    first.ws.reset();
    second.ws.reset();
    server.Stop();
    ioc.run_for(std::chrono::seconds(2));
}

TEST_CASE("An agent that is not accepting refuses the upgrade", "[server][session]") {
    LoopbackAgent agent;
    agent.context().info.accept_connections = false;
    net::io_context ioc;
    AgentServer server(ioc, agent.context());
    REQUIRE(server.Start(0));

    UpgradeAttempt attempt;
    net::co_spawn(ioc, upgradeHub(server.port(), attempt), net::detached);
    runUntil(ioc, [&] { return attempt.done; });

    REQUIRE(attempt.status == http::status::service_unavailable);

    attempt.ws.reset();
    server.Stop();
    ioc.run_for(std::chrono::seconds(2));
}
