#pragma once

#include "../test_helpers.h"
#include <boost/asio/awaitable.hpp>
#include <core/auth/pairing_manager.h>
#include <core/auth/trust_store.h>
#include <core/network/client/capabilities.h>
#include <core/network/server/agent_context.h>
#include <core/network/server/message_handler.h>
#include <core/protocol/message.h>
#include <core/transfer/upload_manager.h>
#include <core/util/binary_message.h>
#include <mutex>
#include <string>
#include <vector>

namespace deckhand::test {

class RecordingSink : public core::EventSink {
public:
    void Publish(const core::Message& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<core::Message> OfType(core::MessageType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<core::Message> matching;
        for (const auto& event : events_) {
            if (event.type == type) {
                matching.push_back(event);
            }
        }
        return matching;
    }

private:
    mutable std::mutex mutex_;
    std::vector<core::Message> events_;
};

// A complete agent behind one hub session, without sockets. Requests go
// through the same text and binary encoding the websocket carries.
class LoopbackAgent : public core::UploaderCapability {
public:
    static constexpr const char* kHubId = "hub-1";

    explicit LoopbackAgent(std::uint64_t chunk_size = 1024 * 1024, bool with_steam = false)
        : trust_(dir_ / "trusted_hubs.json")
        , pairing_(trust_)
        , uploads_(dir_ / "games", chunk_size)
        , context_{
              .info = core::AgentInfo{.id = "a1", .name = "Deck-1", .platform = "linux", .version = "0.1.0"},
              .uploads = uploads_,
              .pairing = pairing_,
              .steam = with_steam ? std::optional<core::SteamPaths>(core::SteamPaths(dir_ / "steam"))
                                  : std::nullopt,
          }
        , handler_(context_, sink_) {
        pairing_.SetCodeCallback([this](const std::string& code, const std::string&, std::chrono::seconds) {
            last_code_ = code;
        });
    }

    // Runs the handshake and pairing so that every later request is authorized
    void Pair() {
        auto status = Send(hello(""));
        if (status.type != core::MessageType::kPairingRequired) {
            throw std::runtime_error("expected pairing_required, got " + core::ToString(status.type));
        }
        auto success = Send(core::Message::Create(core::Message::NewId(),
                                                  core::MessageType::kPairConfirm,
                                                  core::PairConfirmRequest{last_code_}));
        if (success.type != core::MessageType::kPairSuccess) {
            throw std::runtime_error("pairing failed");
        }
        token_ = success.PayloadAs<core::PairSuccessResponse>().token;
    }

    core::Message hello(const std::string& token) const {
        return core::Message::Create(core::Message::NewId(),
                                     core::MessageType::kHubConnected,
                                     core::HubConnectedRequest{"desk", "0.1.0", "linux", kHubId, token});
    }

    // One text request through the wire encoding
    core::Message Send(const core::Message& request) {
        auto reply = handler_.Handle(core::Message::Parse(request.Serialize()));
        if (!reply) {
            throw std::runtime_error("no reply to " + core::ToString(request.type));
        }
        return core::Message::Parse(reply->Serialize());
    }

    core::Message SendChunk(const std::string& upload_id, const core::Chunk& chunk) {
        core::ChunkHeader header{core::Message::NewId(), upload_id, chunk.file_path, chunk.offset, chunk.checksum};
        nlohmann::json j = header;
        j["type"] = core::MessageType::kUploadChunk;
        auto reply = handler_.HandleBinary(CreateBinaryMessage(j, chunk.data));
        return core::Message::Parse(reply.Serialize());
    }

    // The next `count` chunks arrive with a flipped byte
    void CorruptNextChunks(int count) { corrupt_remaining_ = count; }
    int chunks_received() const { return chunks_received_; }
    int chunk_calls() const { return chunk_calls_; }

    boost::asio::awaitable<core::InitUploadResponse> InitUpload(const core::InitUploadRequest& request) override {
        co_return checked(Send(core::Message::Create(core::Message::NewId(),
                                                     core::MessageType::kInitUpload,
                                                     request)))
            .PayloadAs<core::InitUploadResponse>();
    }

    boost::asio::awaitable<core::UploadChunkResponse> UploadChunk(const std::string& upload_id,
                                                                  const core::Chunk& chunk) override {
        ++chunk_calls_;
        auto sent = chunk;
        if (corrupt_remaining_ > 0 && !sent.data.empty()) {
            --corrupt_remaining_;
            sent.data[0] ^= 0xff;
        }
        auto reply = checked(SendChunk(upload_id, sent));
        ++chunks_received_;
        co_return reply.PayloadAs<core::UploadChunkResponse>();
    }

    boost::asio::awaitable<core::CompleteUploadResponse> CompleteUpload(
        const core::CompleteUploadRequest& request) override {
        co_return checked(Send(core::Message::Create(core::Message::NewId(),
                                                     core::MessageType::kCompleteUpload,
                                                     request)))
            .PayloadAs<core::CompleteUploadResponse>();
    }

    boost::asio::awaitable<void> CancelUpload(const std::string& upload_id) override {
        checked(Send(core::Message::Create(core::Message::NewId(),
                                           core::MessageType::kCancelUpload,
                                           core::CancelUploadRequest{upload_id})));
        co_return;
    }

    const TempDir& dir() const { return dir_; }
    core::UploadManager& uploads() { return uploads_; }
    core::AgentContext& context() { return context_; }
    core::TrustStore& trust() { return trust_; }
    core::MessageHandler& handler() { return handler_; }
    const RecordingSink& sink() const { return sink_; }
    const std::string& last_code() const { return last_code_; }
    const std::string& token() const { return token_; }

private:
    static core::Message checked(core::Message reply) {
        if (reply.IsError()) {
            throw core::RemoteError(reply.error->code, reply.error->message);
        }
        return reply;
    }

    TempDir dir_;
    core::TrustStore trust_;
    core::PairingManager pairing_;
    core::UploadManager uploads_;
    core::AgentContext context_;
    RecordingSink sink_;
    core::MessageHandler handler_;

    std::string last_code_;
    std::string token_;
    int corrupt_remaining_{0};
    int chunks_received_{0};
    int chunk_calls_{0};
};

} // namespace deckhand::test
