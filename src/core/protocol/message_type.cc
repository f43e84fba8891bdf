#include <core/protocol/message_type.h>

namespace deckhand::core {

MessageClass ClassOf(MessageType type) {
    switch (type) {
    case MessageType::kHubConnected:
    case MessageType::kAgentStatus:
    case MessageType::kPairingRequired:
    case MessageType::kPairConfirm:
    case MessageType::kPairSuccess:
    case MessageType::kPairFailed:
        return MessageClass::kHandshake;

    case MessageType::kPing:
    case MessageType::kGetInfo:
    case MessageType::kGetConfig:
    case MessageType::kGetSteamUsers:
    case MessageType::kListShortcuts:
    case MessageType::kCreateShortcut:
    case MessageType::kDeleteShortcut:
    case MessageType::kDeleteGame:
    case MessageType::kApplyArtwork:
    case MessageType::kSendArtworkImage:
    case MessageType::kInitUpload:
    case MessageType::kUploadChunk:
    case MessageType::kCompleteUpload:
    case MessageType::kCancelUpload:
        return MessageClass::kRequest;

    case MessageType::kPong:
    case MessageType::kInfoResponse:
    case MessageType::kConfigResponse:
    case MessageType::kSteamUsersResponse:
    case MessageType::kShortcutsResponse:
    case MessageType::kArtworkResponse:
    case MessageType::kArtworkImageResponse:
    case MessageType::kUploadInitResponse:
    case MessageType::kUploadChunkResponse:
    case MessageType::kUploadCompleteResponse:
    case MessageType::kOperationResult:
    case MessageType::kError:
        return MessageClass::kResponse;

    case MessageType::kUploadProgress:
    case MessageType::kOperationEvent:
        return MessageClass::kEvent;

    case MessageType::kUnknown:
        break;
    }
    return MessageClass::kUnknown;
}

std::optional<MessageType> ResponseTypeOf(MessageType request) {
    switch (request) {
    case MessageType::kHubConnected:
        return MessageType::kAgentStatus;
    case MessageType::kPairConfirm:
        return MessageType::kPairSuccess;
    case MessageType::kPing:
        return MessageType::kPong;
    case MessageType::kGetInfo:
        return MessageType::kInfoResponse;
    case MessageType::kGetConfig:
        return MessageType::kConfigResponse;
    case MessageType::kGetSteamUsers:
        return MessageType::kSteamUsersResponse;
    case MessageType::kListShortcuts:
        return MessageType::kShortcutsResponse;
    case MessageType::kApplyArtwork:
        return MessageType::kArtworkResponse;
    case MessageType::kSendArtworkImage:
        return MessageType::kArtworkImageResponse;
    case MessageType::kInitUpload:
        return MessageType::kUploadInitResponse;
    case MessageType::kUploadChunk:
        return MessageType::kUploadChunkResponse;
    case MessageType::kCreateShortcut:
    case MessageType::kDeleteShortcut:
    case MessageType::kDeleteGame:
    case MessageType::kCancelUpload:
        return MessageType::kOperationResult;
    case MessageType::kCompleteUpload:
        return MessageType::kUploadCompleteResponse;
    default:
        return std::nullopt;
    }
}

std::string ToString(MessageType type) {
    nlohmann::json j = type;
    return j.is_string() ? j.get<std::string>() : "unknown";
}

} // namespace deckhand::core
