#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <core/constant/protocol.h>
#include <core/network/client/capabilities.h>
#include <core/network/websocket_channel.h>
#include <core/protocol/message.h>
#include <core/protocol/payloads.h>
#include <core/util/event_queue.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace deckhand::core {

enum class ConnectState {
    kConnected,       // token accepted
    kPairingRequired, // code shown on the agent, call ConfirmPairing
    kPairFailed,      // e.g. rate limited
};

struct ConnectResult {
    ConnectState state = ConnectState::kConnected;
    AgentInfo agent;
    std::int64_t expires_in = 0;
    std::string reason;
};

// Hub side of a hub/agent connection. Requests are correlated by id and may be
// in flight concurrently; every call runs on the client's executor.
class AgentClient : public AgentConnection,
                    public UploaderCapability,
                    public ShortcutManagerCapability,
                    public GameManagerCapability,
                    public std::enable_shared_from_this<AgentClient> {
public:
    static constexpr std::size_t kEventCapacity = 64;

    // `hello` is sent as hub_connected; its token is replaced by Connect's
    AgentClient(boost::asio::any_io_executor executor, HubConnectedRequest hello);
    ~AgentClient() override;

    boost::asio::awaitable<ConnectResult> Connect(const std::string& host,
                                                  std::uint16_t port,
                                                  const std::string& token);

    // Throws PairingError with the agent's reason on failure
    boost::asio::awaitable<PairSuccessResponse> ConfirmPairing(const std::string& code);

    boost::asio::awaitable<Message> Request(Message request,
                                            std::chrono::milliseconds timeout = protocol::kRequestTimeout);

    // Sends a request and returns the typed success payload; throws RemoteError
    // for an error envelope
    template <typename Response, typename Payload>
    boost::asio::awaitable<Response> Call(MessageType type, const Payload& payload) {
        auto reply = co_await Request(Message::Create(Message::NewId(), type, payload));
        co_return checked(reply, type).template PayloadAs<Response>();
    }

    // AgentConnection
    boost::asio::awaitable<AgentInfo> GetInfo() override;
    void Close() override;

    // UploaderCapability
    boost::asio::awaitable<InitUploadResponse> InitUpload(const InitUploadRequest& request) override;
    boost::asio::awaitable<UploadChunkResponse> UploadChunk(const std::string& upload_id,
                                                            const Chunk& chunk) override;
    boost::asio::awaitable<CompleteUploadResponse> CompleteUpload(
        const CompleteUploadRequest& request) override;
    boost::asio::awaitable<void> CancelUpload(const std::string& upload_id) override;

    // ShortcutManagerCapability
    boost::asio::awaitable<ShortcutsResponse> ListShortcuts(const std::string& user_id) override;
    boost::asio::awaitable<std::uint32_t> CreateShortcut(const std::string& user_id,
                                                         const ShortcutConfig& shortcut) override;
    boost::asio::awaitable<void> DeleteShortcut(const std::string& user_id,
                                                std::uint32_t app_id) override;
    boost::asio::awaitable<ArtworkResponse> ApplyArtwork(const std::string& user_id,
                                                         std::uint32_t app_id,
                                                         const ArtworkConfig& artwork) override;

    // GameManagerCapability
    boost::asio::awaitable<std::vector<SteamUserInfo>> GetSteamUsers() override;
    boost::asio::awaitable<void> DeleteGame(const std::string& user_id, std::uint32_t app_id) override;

    // upload_progress and operation_event pushed by the agent
    EventQueue<Message>& events() { return events_; }

    bool connected() const { return channel_ && !channel_->closed() && !disconnected_; }
    const std::optional<AgentInfo>& agent() const { return agent_; }

private:
    struct Pending {
        explicit Pending(boost::asio::any_io_executor executor)
            : timer(executor) {}

        boost::asio::steady_timer timer;
        std::optional<Message> reply;
    };

    boost::asio::awaitable<Message> await(const std::string& id,
                                          std::chrono::milliseconds timeout,
                                          std::function<void()> send);
    boost::asio::awaitable<void> readLoop();
    void failPending();

    // Throws RemoteError for an error envelope or a reply of the wrong type
    static const Message& checked(const Message& reply, MessageType request);

    boost::asio::any_io_executor executor_;
    HubConnectedRequest hello_;
    std::shared_ptr<WebsocketChannel> channel_;
    std::unordered_map<std::string, std::shared_ptr<Pending>> pending_;
    EventQueue<Message> events_;
    std::optional<AgentInfo> agent_;
    bool disconnected_{false};
};

} // namespace deckhand::core
