#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <core/auth/pairing_manager.h>
#include <core/network/client/agent_client.h>
#include <format>
#include <spdlog/spdlog.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace deckhand::core {

AgentClient::AgentClient(net::any_io_executor executor, HubConnectedRequest hello)
    : executor_(std::move(executor))
    , hello_(std::move(hello))
    , events_(kEventCapacity) {}

AgentClient::~AgentClient() {
    if (channel_) {
        channel_->Close();
    }
}

net::awaitable<ConnectResult> AgentClient::Connect(const std::string& host,
                                                   std::uint16_t port,
                                                   const std::string& token) {
    tcp::resolver resolver(executor_);
    auto endpoints = co_await resolver.async_resolve(host, std::to_string(port), net::use_awaitable);

    beast::tcp_stream stream(executor_);
    stream.expires_after(protocol::kConnectTimeout);
    co_await stream.async_connect(endpoints, net::use_awaitable);

    WebsocketStream ws(std::move(stream));
    websocket::response_type response;
    boost::system::error_code ec;
    co_await ws.async_handshake(response,
                                std::format("{}:{}", host, port),
                                protocol::kWebsocketPath,
                                net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        if (response.result_int() != 0 && response.result() != http::status::switching_protocols) {
            throw RemoteError(static_cast<int>(response.result_int()),
                              response.body().empty() ? std::string(response.reason())
                                                      : response.body());
        }
        throw boost::system::system_error(ec);
    }

    channel_ = std::make_shared<WebsocketChannel>(std::move(ws));
    channel_->Start();
    net::co_spawn(executor_,
                  [self = shared_from_this()]() { return self->readLoop(); },
                  net::detached);

    auto hello = hello_;
    hello.token = token;
    auto reply = co_await Request(Message::Create(Message::NewId(), MessageType::kHubConnected, hello));
    if (reply.IsError()) {
        throw RemoteError(reply.error->code, reply.error->message);
    }

    ConnectResult result;
    switch (reply.type) {
    case MessageType::kAgentStatus:
        result.state = ConnectState::kConnected;
        result.agent = reply.PayloadAs<AgentInfo>();
        agent_ = result.agent;
        spdlog::info("Connected to agent {} ({})", result.agent.name, result.agent.id);
        break;
    case MessageType::kPairingRequired:
        result.state = ConnectState::kPairingRequired;
        result.expires_in = reply.PayloadAs<PairingRequiredResponse>().expires_in;
        break;
    case MessageType::kPairFailed:
        result.state = ConnectState::kPairFailed;
        result.reason = reply.PayloadAs<PairFailedResponse>().reason;
        break;
    default:
        throw ProtocolError("unexpected reply to hub_connected: " + ToString(reply.type));
    }
    co_return result;
}

net::awaitable<PairSuccessResponse> AgentClient::ConfirmPairing(const std::string& code) {
    auto reply = co_await Request(
        Message::Create(Message::NewId(), MessageType::kPairConfirm, PairConfirmRequest{code}));
    if (reply.IsError()) {
        throw RemoteError(reply.error->code, reply.error->message);
    }
    if (reply.type == MessageType::kPairFailed) {
        auto reason = reply.PayloadAs<PairFailedResponse>().reason;
        throw PairingError(nlohmann::json(reason).get<PairingFailure>(), "pairing failed: " + reason);
    }
    if (reply.type != MessageType::kPairSuccess) {
        throw ProtocolError("unexpected reply to pair_confirm: " + ToString(reply.type));
    }
    auto success = reply.PayloadAs<PairSuccessResponse>();
    co_return success;
}

const Message& AgentClient::checked(const Message& reply, MessageType request) {
    if (reply.IsError()) {
        throw RemoteError(reply.error->code, reply.error->message);
    }
    if (ResponseTypeOf(request) != reply.type) {
        throw ProtocolError(std::format("unexpected reply {} to {}", ToString(reply.type), ToString(request)));
    }
    return reply;
}

net::awaitable<Message> AgentClient::Request(Message request, std::chrono::milliseconds timeout) {
    auto id = request.id;
    auto text = request.Serialize();
    co_return co_await await(id, timeout, [this, text = std::move(text)]() mutable {
        channel_->SendText(std::move(text));
    });
}

net::awaitable<Message> AgentClient::await(const std::string& id,
                                           std::chrono::milliseconds timeout,
                                           std::function<void()> send) {
    if (!connected()) {
        throw boost::system::system_error(net::error::not_connected);
    }
    auto pending = std::make_shared<Pending>(executor_);
    pending_[id] = pending;
    send();

    pending->timer.expires_after(timeout);
    boost::system::error_code ec;
    co_await pending->timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    pending_.erase(id);

    if (pending->reply) {
        co_return std::move(*pending->reply);
    }
    if (!ec) {
        throw boost::system::system_error(net::error::timed_out, "no reply to request " + id);
    }
    throw boost::system::system_error(net::error::connection_aborted, "connection lost");
}

net::awaitable<void> AgentClient::readLoop() {
    auto self = shared_from_this();
    try {
        while (connected()) {
            auto frame = co_await channel_->Read();
            if (frame.binary) {
                spdlog::debug("Ignoring binary frame from agent");
                continue;
            }
            Message message;
            try {
                message = Message::Parse(frame.text());
            } catch (const ProtocolError& e) {
                spdlog::warn("Bad message from agent: {}", e.what());
                continue;
            }

            if (ClassOf(message.type) == MessageClass::kEvent) {
                events_.TryPush(std::move(message));
                continue;
            }
            auto it = pending_.find(message.id);
            if (it == pending_.end()) {
                spdlog::debug("Reply {} matches no pending request", message.id);
                continue;
            }
            it->second->reply = std::move(message);
            it->second->timer.cancel();
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() != websocket::error::closed && e.code() != net::error::operation_aborted) {
            spdlog::warn("Connection to agent lost: {}", e.what());
        }
    }
    disconnected_ = true;
    channel_->Close();
    failPending();
}

void AgentClient::failPending() {
    for (auto& [id, pending] : pending_) {
        pending->timer.cancel();
    }
}

void AgentClient::Close() {
    if (channel_) {
        channel_->Close();
    }
}

// AgentConnection

net::awaitable<AgentInfo> AgentClient::GetInfo() {
    auto info = co_await Call<InfoResponse>(MessageType::kGetInfo, nlohmann::json::object());
    agent_ = info.agent;
    co_return info.agent;
}

// UploaderCapability

net::awaitable<InitUploadResponse> AgentClient::InitUpload(const InitUploadRequest& request) {
    co_return co_await Call<InitUploadResponse>(MessageType::kInitUpload, request);
}

net::awaitable<UploadChunkResponse> AgentClient::UploadChunk(const std::string& upload_id,
                                                             const Chunk& chunk) {
    ChunkHeader header{Message::NewId(), upload_id, chunk.file_path, chunk.offset, chunk.checksum};
    nlohmann::json j = header;
    j["type"] = MessageType::kUploadChunk;
    auto frame = CreateBinaryMessage(j, chunk.data);

    auto reply = co_await await(header.id, protocol::kRequestTimeout, [this, frame = std::move(frame)]() mutable {
        channel_->SendBinary(std::move(frame));
    });
    co_return checked(reply, MessageType::kUploadChunk).PayloadAs<UploadChunkResponse>();
}

net::awaitable<CompleteUploadResponse> AgentClient::CompleteUpload(const CompleteUploadRequest& request) {
    co_return co_await Call<CompleteUploadResponse>(MessageType::kCompleteUpload, request);
}

net::awaitable<void> AgentClient::CancelUpload(const std::string& upload_id) {
    co_await Call<OperationResult>(MessageType::kCancelUpload, CancelUploadRequest{upload_id});
}

// ShortcutManagerCapability

net::awaitable<ShortcutsResponse> AgentClient::ListShortcuts(const std::string& user_id) {
    co_return co_await Call<ShortcutsResponse>(MessageType::kListShortcuts, ListShortcutsRequest{user_id});
}

net::awaitable<std::uint32_t> AgentClient::CreateShortcut(const std::string& user_id,
                                                          const ShortcutConfig& shortcut) {
    auto result = co_await Call<OperationResult>(MessageType::kCreateShortcut,
                                                 CreateShortcutRequest{user_id, shortcut});
    co_return result.app_id;
}

net::awaitable<void> AgentClient::DeleteShortcut(const std::string& user_id, std::uint32_t app_id) {
    co_await Call<OperationResult>(MessageType::kDeleteShortcut, DeleteShortcutRequest{user_id, app_id});
}

net::awaitable<ArtworkResponse> AgentClient::ApplyArtwork(const std::string& user_id,
                                                          std::uint32_t app_id,
                                                          const ArtworkConfig& artwork) {
    co_return co_await Call<ArtworkResponse>(MessageType::kApplyArtwork,
                                             ApplyArtworkRequest{user_id, app_id, artwork});
}

// GameManagerCapability

net::awaitable<std::vector<SteamUserInfo>> AgentClient::GetSteamUsers() {
    auto response = co_await Call<SteamUsersResponse>(MessageType::kGetSteamUsers,
                                                      nlohmann::json::object());
    co_return response.users;
}

net::awaitable<void> AgentClient::DeleteGame(const std::string& user_id, std::uint32_t app_id) {
    co_await Call<OperationResult>(MessageType::kDeleteGame, DeleteGameRequest{user_id, app_id});
}

} // namespace deckhand::core
