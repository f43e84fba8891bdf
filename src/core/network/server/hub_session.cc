#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/constant/protocol.h>
#include <core/network/server/hub_session.h>
#include <spdlog/spdlog.h>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;

namespace deckhand::core {

namespace {

// Echo the id of an envelope we could not fully parse, when it has one
std::string salvageId(std::string_view text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_object() && j.contains("id") && j["id"].is_string()) {
        return j["id"].get<std::string>();
    }
    return {};
}

} // namespace

HubSession::HubSession(AgentContext& agent, WebsocketStream ws)
    : channel_(std::make_shared<WebsocketChannel>(std::move(ws)))
    , handler_(agent, *this)
    , ping_timer_(channel_->stream().get_executor())
    , pong_received_(std::make_shared<std::atomic<bool>>(true)) {
    channel_->stream().control_callback(
        [pong = pong_received_](websocket::frame_type kind, beast::string_view) {
            if (kind == websocket::frame_type::pong) {
                *pong = true;
            }
        });
}

void HubSession::Publish(const Message& event) {
    if (!closed_) {
        channel_->Send(event);
    }
}

void HubSession::Close() {
    if (closed_.exchange(true)) {
        return;
    }
    ping_timer_.cancel();
    channel_->Close();
}

void HubSession::dispatch(const Frame& frame) {
    if (frame.binary) {
        channel_->Send(handler_.HandleBinary(frame.data));
        return;
    }

    Message request;
    try {
        request = Message::Parse(frame.text());
    } catch (const ProtocolError& e) {
        spdlog::warn("Rejected message from hub: {}", e.what());
        auto reply = Message::Create(salvageId(frame.text()), MessageType::kUnknown);
        channel_->Send(reply.ErrorReply(ErrorCode::kBadRequest, e.what()));
        return;
    }
    if (auto reply = handler_.Handle(request)) {
        channel_->Send(*reply);
    }
}

net::awaitable<void> HubSession::Run() {
    auto self = shared_from_this();
    channel_->Start();
    net::co_spawn(ping_timer_.get_executor(),
                  [self]() { return self->keepalive(); },
                  net::detached);

    try {
        while (!closed_) {
            auto frame = co_await channel_->Read();
            dispatch(frame);
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() == websocket::error::closed || e.code() == net::error::eof
            || e.code() == net::error::operation_aborted) {
            spdlog::debug("Hub connection closed: {}", e.code().message());
        } else {
            spdlog::warn("Hub connection lost: {}", e.what());
        }
    }

    if (const auto& hub = handler_.hub()) {
        spdlog::info("Hub {} ({}) disconnected", hub->name, hub->hub_id);
    }
    Close();
    handler_.Disconnected();
}

net::awaitable<void> HubSession::keepalive() {
    auto self = shared_from_this();
    while (!closed_) {
        boost::system::error_code ec;
        ping_timer_.expires_after(protocol::kPingInterval - protocol::kPongDeadline);
        co_await ping_timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (ec || closed_) {
            break;
        }

        *pong_received_ = false;
        co_await channel_->stream().async_ping({}, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            break;
        }

        ping_timer_.expires_after(protocol::kPongDeadline);
        co_await ping_timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (ec || closed_) {
            break;
        }
        if (!*pong_received_) {
            spdlog::warn("No pong from hub within {}s, closing connection",
                         protocol::kPongDeadline.count());
            Close();
            break;
        }
    }
}

} // namespace deckhand::core
