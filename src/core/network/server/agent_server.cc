#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <core/constant/protocol.h>
#include <core/network/server/agent_server.h>
#include <format>
#include <spdlog/spdlog.h>

namespace deckhand::core {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

AgentServer::AgentServer(net::io_context& io_context, AgentContext& agent)
    : io_context_(io_context)
    , agent_(agent)
    , acceptor_(io_context)
    , hub_slot_(std::make_shared<bool>(false)) {
    AddRoute("/health", http::verb::get, [this](const HttpRequest& req) -> net::awaitable<HttpResponse> {
        co_return Ok(req.version(), req.keep_alive(), statusJson());
    });
    AddRoute("/info", http::verb::get, [this](const HttpRequest& req) -> net::awaitable<HttpResponse> {
        co_return Ok(req.version(), req.keep_alive(), nlohmann::json(agent_.info).dump());
    });
}

AgentServer::~AgentServer() {
    if (running_) {
        Stop();
    }
}

void AgentServer::AddRoute(const std::string& path, http::verb method, RequestHandler&& handler) {
    routes_[path] = {method, std::move(handler)};
    spdlog::debug("Added route: {} {}", std::string(http::to_string(method)), path);
}

std::string AgentServer::statusJson() const {
    auto session = session_.lock();
    nlohmann::json status = agent_.info;
    status["hub_connected"] = session && !session->closed();
    return status.dump();
}

bool AgentServer::Start(std::uint16_t port) {
    if (running_) {
        spdlog::warn("Server is already running.");
        return true;
    }

    try {
        tcp::endpoint endpoint(tcp::v4(), port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        port_ = acceptor_.local_endpoint().port();
        running_ = true;
        spdlog::info("Agent server listening on port {}", port_);

        net::co_spawn(io_context_, acceptConnections(), net::detached);
        return true;
    } catch (const boost::system::system_error& e) {
        spdlog::error("Failed to start server on port {}: {}", port, e.what());
        running_ = false;
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }
}

void AgentServer::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    boost::system::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
    if (auto session = session_.lock()) {
        session->Close();
    }
    spdlog::info("Agent server stopped.");
}

HttpResponse AgentServer::Ok(unsigned int version, bool keep_alive, std::string_view body) {
    HttpResponse res{http::status::ok, version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.keep_alive(keep_alive);
    res.set(http::field::content_type, "application/json");
    res.body() = body;
    res.prepare_payload();
    return res;
}

HttpResponse AgentServer::Error(http::status status,
                                unsigned int version,
                                bool keep_alive,
                                std::string_view error_message) {
    HttpResponse res{status, version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.keep_alive(keep_alive);
    res.set(http::field::content_type, "text/plain");
    res.body() = error_message;
    res.prepare_payload();
    return res;
}

net::awaitable<void> AgentServer::acceptConnections() {
    while (running_) {
        try {
            tcp::socket socket = co_await acceptor_.async_accept(net::use_awaitable);
            spdlog::debug("Accepted connection from: {}",
                          socket.remote_endpoint().address().to_string());
            net::co_spawn(io_context_,
                          handleConnection(beast::tcp_stream(std::move(socket))),
                          net::detached);
        } catch (const boost::system::system_error& e) {
            if (e.code() == net::error::operation_aborted) {
                spdlog::debug("Accept operation cancelled.");
                break;
            }
            spdlog::error("Error accepting connection: {}", e.what());
        }
    }
}

net::awaitable<void> AgentServer::handleConnection(beast::tcp_stream stream) {
    try {
        beast::flat_buffer buffer;
        bool keep_alive = true;

        while (keep_alive && running_) {
            stream.expires_after(protocol::kConnectTimeout);

            http::request_parser<http::string_body> parser;
            parser.body_limit(64 * 1024);
            co_await http::async_read(stream, buffer, parser, net::use_awaitable);
            auto req = parser.release();

            if (websocket::is_upgrade(req)) {
                co_await upgrade(stream, std::move(req));
                co_return;
            }

            spdlog::debug("Received {} request for {}", std::string(req.method_string()), std::string(req.target()));
            keep_alive = req.keep_alive();
            auto res = co_await handleRequest(req);
            co_await http::async_write(stream, res, net::use_awaitable);
        }

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    } catch (const boost::system::system_error& e) {
        if (e.code() == beast::error::timeout || e.code() == net::error::eof
            || e.code() == net::error::operation_aborted || e.code() == http::error::end_of_stream) {
            spdlog::debug("Connection closed by peer: {}", e.code().message());
        } else {
            spdlog::error("Connection error: {}", e.what());
        }
    }
}

net::awaitable<void> AgentServer::upgrade(beast::tcp_stream& stream, HttpRequest request) {
    auto reject = [&](http::status status, std::string_view reason) -> net::awaitable<void> {
        spdlog::info("Rejected websocket upgrade: {}", reason);
        auto res = Error(status, request.version(), false, reason);
        co_await http::async_write(stream, res, net::use_awaitable);
    };

    if (request.target() != protocol::kWebsocketPath) {
        co_await reject(http::status::not_found, "Not Found");
        co_return;
    }
    if (!agent_.info.accept_connections) {
        co_await reject(http::status::service_unavailable, "agent is not accepting connections");
        co_return;
    }
    if (*hub_slot_) {
        co_await reject(http::status::conflict, "another hub is already connected");
        co_return;
    }

    // Held from here until the upgrade fails or the session ends, so a second
    // upgrade arriving while this one is still handshaking is refused
    *hub_slot_ = true;
    struct SlotRelease {
        std::shared_ptr<bool> slot;
        ~SlotRelease() { *slot = false; }
    } release{hub_slot_};

    auto remote = stream.socket().remote_endpoint();
    stream.expires_never();
    WebsocketStream ws(std::move(stream));
    ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    }));
    co_await ws.async_accept(request, net::use_awaitable);

    auto session = std::make_shared<HubSession>(agent_, std::move(ws));
    session_ = session;
    spdlog::info("Hub connection from {}:{}", remote.address().to_string(), remote.port());
    co_await session->Run();
}

net::awaitable<HttpResponse> AgentServer::handleRequest(const HttpRequest& req) {
    std::string path(req.target());
    auto it = routes_.find(path);
    if (it == routes_.end()) {
        spdlog::debug("Route not found: {}", path);
        co_return Error(http::status::not_found, req.version(), req.keep_alive(), "Not Found");
    }

    const auto& route_info = it->second;
    if (route_info.method != req.method()) {
        co_return Error(http::status::method_not_allowed,
                        req.version(),
                        req.keep_alive(),
                        "Method Not Allowed");
    }

    co_return co_await route_info.handler(req);
}

} // namespace deckhand::core
