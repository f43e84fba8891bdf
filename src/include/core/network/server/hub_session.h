#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <core/network/server/message_handler.h>
#include <core/network/websocket_channel.h>
#include <memory>

namespace deckhand::core {

// One connected hub on the agent side: read loop, keepalive and event push
class HubSession : public EventSink, public std::enable_shared_from_this<HubSession> {
public:
    HubSession(AgentContext& agent, WebsocketStream ws);

    // Returns once the connection is gone
    boost::asio::awaitable<void> Run();

    void Publish(const Message& event) override;
    void Close();

    bool closed() const { return closed_; }
    const MessageHandler& handler() const { return handler_; }

private:
    boost::asio::awaitable<void> keepalive();
    void dispatch(const Frame& frame);

    std::shared_ptr<WebsocketChannel> channel_;
    MessageHandler handler_;
    boost::asio::steady_timer ping_timer_;
    std::shared_ptr<std::atomic<bool>> pong_received_;
    std::atomic<bool> closed_{false};
};

} // namespace deckhand::core
