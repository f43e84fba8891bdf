#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket.hpp>
#include <core/protocol/message.h>
#include <core/util/binary_message.h>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

namespace deckhand::core {

using WebsocketStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

struct Frame {
    bool binary = false;
    std::vector<std::uint8_t> data;

    std::string_view text() const {
        return {reinterpret_cast<const char*>(data.data()), data.size()};
    }
};

// One open websocket. Writes from any thread are queued and sent in order by a
// single writer coroutine; reads are done by the owner.
class WebsocketChannel : public std::enable_shared_from_this<WebsocketChannel> {
public:
    explicit WebsocketChannel(WebsocketStream ws);

    // Applies message size limit and websocket timeouts, then starts the writer
    void Start();

    void Send(const Message& message);
    void SendText(std::string text);
    void SendBinary(BinaryMessage data);

    // Throws boost::system::system_error when the connection goes away
    boost::asio::awaitable<Frame> Read();

    // Safe from any thread
    void Close();
    bool closed() const { return closed_; }

    WebsocketStream& stream() { return ws_; }

private:
    struct Outgoing {
        bool binary = false;
        std::vector<std::uint8_t> data;
    };

    void enqueue(Outgoing frame);
    void closeNow();
    boost::asio::awaitable<void> writer();

    WebsocketStream ws_;
    boost::beast::flat_buffer read_buffer_;
    std::deque<Outgoing> queue_;
    boost::asio::steady_timer signal_;
    boost::asio::steady_timer write_deadline_;
    std::atomic<bool> closed_{false};
};

} // namespace deckhand::core
