#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/constant/protocol.h>
#include <core/network/websocket_channel.h>
#include <spdlog/spdlog.h>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;

namespace deckhand::core {

WebsocketChannel::WebsocketChannel(WebsocketStream ws)
    : ws_(std::move(ws))
    , signal_(ws_.get_executor())
    , write_deadline_(ws_.get_executor()) {
    signal_.expires_at(std::chrono::steady_clock::time_point::max());
}

void WebsocketChannel::Start() {
    ws_.read_message_max(protocol::kMaxMessageSize);
    beast::get_lowest_layer(ws_).expires_never();
    websocket::stream_base::timeout timeout{};
    timeout.handshake_timeout = protocol::kConnectTimeout;
    timeout.idle_timeout = websocket::stream_base::none();
    timeout.keep_alive_pings = false;
    ws_.set_option(timeout);

    net::co_spawn(ws_.get_executor(),
                  [self = shared_from_this()]() { return self->writer(); },
                  net::detached);
}

void WebsocketChannel::Send(const Message& message) {
    SendText(message.Serialize());
}

void WebsocketChannel::SendText(std::string text) {
    enqueue(Outgoing{false, std::vector<std::uint8_t>(text.begin(), text.end())});
}

void WebsocketChannel::SendBinary(BinaryMessage data) {
    enqueue(Outgoing{true, std::move(data)});
}

void WebsocketChannel::enqueue(Outgoing frame) {
    net::post(ws_.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
        if (self->closed_) {
            return;
        }
        self->queue_.push_back(std::move(frame));
        self->signal_.cancel_one();
    });
}

net::awaitable<void> WebsocketChannel::writer() {
    while (!closed_) {
        if (queue_.empty()) {
            boost::system::error_code ec;
            co_await signal_.async_wait(net::redirect_error(net::use_awaitable, ec));
            continue;
        }

        auto frame = std::move(queue_.front());
        queue_.pop_front();

        write_deadline_.expires_after(protocol::kWriteWait);
        write_deadline_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (!ec) {
                spdlog::warn("Websocket write timed out, closing connection");
                self->closeNow();
            }
        });

        boost::system::error_code ec;
        ws_.binary(frame.binary);
        co_await ws_.async_write(net::buffer(frame.data), net::redirect_error(net::use_awaitable, ec));
        write_deadline_.cancel();
        if (ec) {
            if (ec != net::error::operation_aborted && ec != websocket::error::closed) {
                spdlog::warn("Websocket write failed: {}", ec.message());
            }
            closeNow();
            break;
        }
    }
    queue_.clear();
}

net::awaitable<Frame> WebsocketChannel::Read() {
    read_buffer_.clear();
    co_await ws_.async_read(read_buffer_, net::use_awaitable);
    Frame frame;
    frame.binary = ws_.got_binary();
    auto data = read_buffer_.data();
    auto* begin = static_cast<const std::uint8_t*>(data.data());
    frame.data.assign(begin, begin + data.size());
    co_return frame;
}

void WebsocketChannel::Close() {
    net::post(ws_.get_executor(), [self = shared_from_this()] { self->closeNow(); });
}

void WebsocketChannel::closeNow() {
    if (closed_.exchange(true)) {
        return;
    }
    signal_.cancel();
    write_deadline_.cancel();
    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
    beast::get_lowest_layer(ws_).close();
}

} // namespace deckhand::core
