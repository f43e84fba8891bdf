#pragma once

#include <chrono>
#include <core/model/operation_event.h>
#include <core/network/server/agent_context.h>
#include <core/protocol/message.h>
#include <core/protocol/payloads.h>
#include <core/util/binary_message.h>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace deckhand::core {

// Where a handler pushes unsolicited events (upload_progress, operation_event)
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void Publish(const Message& event) = 0;
};

// Connected hub as announced in hub_connected
struct HubIdentity {
    std::string hub_id;
    std::string name;
    std::string platform;
    std::string version;
};

// Request dispatch for one hub connection. Every request gets exactly one reply;
// failures come back as an error envelope, never as an exception.
class MessageHandler {
public:
    MessageHandler(AgentContext& agent, EventSink& events);

    // std::nullopt for messages that take no reply (responses and events from the hub)
    std::optional<Message> Handle(const Message& request);

    // upload_chunk and send_artwork_image frames
    Message HandleBinary(std::span<const std::uint8_t> frame);

    // The connection is gone: active uploads it started are cancelled (files stay
    // on disk) and a pairing code issued to it is withdrawn
    void Disconnected();

    bool authorized() const { return authorized_; }
    const std::optional<HubIdentity>& hub() const { return hub_; }

private:
    Message dispatch(const Message& request);

    Message handleHubConnected(const Message& request);
    Message handlePairConfirm(const Message& request);
    Message handleGetInfo(const Message& request);
    Message handleGetConfig(const Message& request);
    Message handleGetSteamUsers(const Message& request);
    Message handleListShortcuts(const Message& request);
    Message handleCreateShortcut(const Message& request);
    Message handleDeleteShortcut(const Message& request);
    Message handleDeleteGame(const Message& request);
    Message handleApplyArtwork(const Message& request);
    Message handleInitUpload(const Message& request);
    Message handleCompleteUpload(const Message& request);
    Message handleCancelUpload(const Message& request);

    Message handleChunk(const Message& request, ParsedBinaryMessage frame);
    Message handleArtworkImage(const Message& request, ParsedBinaryMessage frame);

    const SteamPaths& steam() const;
    void requireUser(const std::string& user_id) const;
    std::uint32_t createShortcut(const std::string& user_id, const ShortcutConfig& config);
    ArtworkResponse applyArtwork(const std::string& user_id,
                                 std::uint32_t app_id,
                                 const ArtworkConfig& artwork);
    void applyParkedArtwork(const std::string& user_id, std::uint32_t app_id);
    void publishProgress(const UploadProgress& progress, bool force);
    void publishOperation(OperationKind kind,
                          OperationStatus status,
                          const std::string& game_name,
                          double progress,
                          std::string message = {});

    struct ParkedArtwork {
        std::string user_id;
        std::string artwork_type;
        std::string content_type;
        BinaryData data;
    };

    AgentContext& agent_;
    EventSink& events_;
    std::optional<HubIdentity> hub_;
    bool authorized_{false};
    std::vector<ParkedArtwork> parked_artwork_;
    std::vector<std::string> upload_ids_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> last_progress_;
};

} // namespace deckhand::core
