#pragma once

#include <nlohmann/json.hpp>
#include <optional>

namespace deckhand::core {

enum class MessageType {
    kUnknown, // any type string this build does not know

    // handshake / pairing
    kHubConnected,
    kAgentStatus,
    kPairingRequired,
    kPairConfirm,
    kPairSuccess,
    kPairFailed,

    // keepalive
    kPing,
    kPong,

    // requests and their responses
    kGetInfo,
    kInfoResponse,
    kGetConfig,
    kConfigResponse,
    kGetSteamUsers,
    kSteamUsersResponse,
    kListShortcuts,
    kShortcutsResponse,
    kCreateShortcut,
    kDeleteShortcut,
    kDeleteGame,
    kApplyArtwork,
    kArtworkResponse,
    kSendArtworkImage,
    kArtworkImageResponse,
    kInitUpload,
    kUploadInitResponse,
    kUploadChunk,
    kUploadChunkResponse,
    kCompleteUpload,
    kUploadCompleteResponse,
    kCancelUpload,
    kOperationResult,
    kError,

    // events pushed by the agent
    kUploadProgress,
    kOperationEvent,
};

NLOHMANN_JSON_SERIALIZE_ENUM(MessageType,
                             {
                                 {MessageType::kUnknown, nullptr},
                                 {MessageType::kHubConnected, "hub_connected"},
                                 {MessageType::kAgentStatus, "agent_status"},
                                 {MessageType::kPairingRequired, "pairing_required"},
                                 {MessageType::kPairConfirm, "pair_confirm"},
                                 {MessageType::kPairSuccess, "pair_success"},
                                 {MessageType::kPairFailed, "pair_failed"},
                                 {MessageType::kPing, "ping"},
                                 {MessageType::kPong, "pong"},
                                 {MessageType::kGetInfo, "get_info"},
                                 {MessageType::kInfoResponse, "info_response"},
                                 {MessageType::kGetConfig, "get_config"},
                                 {MessageType::kConfigResponse, "config_response"},
                                 {MessageType::kGetSteamUsers, "get_steam_users"},
                                 {MessageType::kSteamUsersResponse, "steam_users_response"},
                                 {MessageType::kListShortcuts, "list_shortcuts"},
                                 {MessageType::kShortcutsResponse, "shortcuts_response"},
                                 {MessageType::kCreateShortcut, "create_shortcut"},
                                 {MessageType::kDeleteShortcut, "delete_shortcut"},
                                 {MessageType::kDeleteGame, "delete_game"},
                                 {MessageType::kApplyArtwork, "apply_artwork"},
                                 {MessageType::kArtworkResponse, "artwork_response"},
                                 {MessageType::kSendArtworkImage, "send_artwork_image"},
                                 {MessageType::kArtworkImageResponse, "artwork_image_response"},
                                 {MessageType::kInitUpload, "init_upload"},
                                 {MessageType::kUploadInitResponse, "upload_init_response"},
                                 {MessageType::kUploadChunk, "upload_chunk"},
                                 {MessageType::kUploadChunkResponse, "upload_chunk_response"},
                                 {MessageType::kCompleteUpload, "complete_upload"},
                                 {MessageType::kUploadCompleteResponse, "upload_complete_response"},
                                 {MessageType::kCancelUpload, "cancel_upload"},
                                 {MessageType::kOperationResult, "operation_result"},
                                 {MessageType::kError, "error"},
                                 {MessageType::kUploadProgress, "upload_progress"},
                                 {MessageType::kOperationEvent, "operation_event"},
                             });

enum class MessageClass {
    kHandshake,
    kRequest,
    kResponse,
    kEvent,
    kUnknown,
};

MessageClass ClassOf(MessageType type);

// Success response type of a request; std::nullopt for anything that is not a request
std::optional<MessageType> ResponseTypeOf(MessageType request);

std::string ToString(MessageType type);

} // namespace deckhand::core
