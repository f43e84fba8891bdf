#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <core/network/server/agent_context.h>
#include <core/network/server/hub_session.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace deckhand::core {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using RequestHandler = std::function<boost::asio::awaitable<HttpResponse>(const HttpRequest&)>;

struct RouteInfo {
    boost::beast::http::verb method;
    RequestHandler handler;
};

// Plain HTTP on the agent port: small read-only routes plus the websocket
// upgrade that carries the hub protocol. One hub session at a time.
class AgentServer {
public:
    AgentServer(boost::asio::io_context& io_context, AgentContext& agent);
    ~AgentServer();

    void AddRoute(const std::string& path, boost::beast::http::verb method, RequestHandler&& handler);

    // Port 0 binds an ephemeral port; port() reports the bound one
    bool Start(std::uint16_t port);
    void Stop();

    std::uint16_t port() const { return port_; }
    bool running() const { return running_; }

    static HttpResponse Ok(unsigned int version, bool keep_alive, std::string_view body = {});
    static HttpResponse Error(boost::beast::http::status status,
                              unsigned int version,
                              bool keep_alive,
                              std::string_view error_message);

private:
    boost::asio::awaitable<void> acceptConnections();
    boost::asio::awaitable<void> handleConnection(boost::beast::tcp_stream stream);
    boost::asio::awaitable<HttpResponse> handleRequest(const HttpRequest& request);

    // Takes over the stream when the upgrade is accepted
    boost::asio::awaitable<void> upgrade(boost::beast::tcp_stream& stream, HttpRequest request);

    std::string statusJson() const;

    boost::asio::io_context& io_context_;
    AgentContext& agent_;
    boost::asio::ip::tcp::acceptor acceptor_;
    bool running_{false};
    std::uint16_t port_{0};
    std::map<std::string, RouteInfo> routes_;
    std::weak_ptr<HubSession> session_;
    // set while a hub is upgrading or connected
    std::shared_ptr<bool> hub_slot_;
};

} // namespace deckhand::core
