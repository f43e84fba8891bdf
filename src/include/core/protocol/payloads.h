#pragma once

#include <core/model/agent_info.h>
#include <core/model/shortcut.h>
#include <core/model/upload.h>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace deckhand::core {

// handshake / pairing

struct HubConnectedRequest {
    std::string name;
    std::string version;
    std::string platform;
    std::string hub_id;
    std::string token; // empty on first contact

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(
        HubConnectedRequest, name, version, platform, hub_id, token)
};

// The code itself is only shown on the agent's own display
struct PairingRequiredResponse {
    std::int64_t expires_in = 0; // seconds

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(PairingRequiredResponse, expires_in)
};

struct PairConfirmRequest {
    std::string code;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(PairConfirmRequest, code)
};

struct PairSuccessResponse {
    std::string token;
    std::string agent_id;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(PairSuccessResponse, token, agent_id)
};

struct PairFailedResponse {
    std::string reason; // "expired", "invalid_code", "rate_limited", "no_pending"

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(PairFailedResponse, reason)
};

// queries

struct InfoResponse {
    AgentInfo agent;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(InfoResponse, agent)
};

struct ConfigResponse {
    std::string install_path;
    std::uint64_t chunk_size = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ConfigResponse, install_path, chunk_size)
};

struct SteamUserInfo {
    std::string id;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(SteamUserInfo, id)
};

struct SteamUsersResponse {
    std::vector<SteamUserInfo> users;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(SteamUsersResponse, users)
};

// shortcuts and games

struct ListShortcutsRequest {
    std::string user_id;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ListShortcutsRequest, user_id)
};

struct ShortcutsResponse {
    std::vector<ShortcutInfo> shortcuts;
    std::string warning; // set when the database could not be read

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ShortcutsResponse, shortcuts, warning)
};

struct CreateShortcutRequest {
    std::string user_id;
    ShortcutConfig shortcut;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(CreateShortcutRequest, user_id, shortcut)
};

struct DeleteShortcutRequest {
    std::string user_id;
    std::uint32_t app_id = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(DeleteShortcutRequest, user_id, app_id)
};

struct DeleteGameRequest {
    std::string user_id;
    std::uint32_t app_id = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(DeleteGameRequest, user_id, app_id)
};

struct OperationResult {
    bool success = false;
    std::string message;
    std::uint32_t app_id = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(OperationResult, success, message, app_id)
};

// artwork

// Image paths are files on the agent
struct ApplyArtworkRequest {
    std::string user_id;
    std::uint32_t app_id = 0;
    ArtworkConfig artwork;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ApplyArtworkRequest, user_id, app_id, artwork)
};

struct ArtworkFailure {
    std::string type;
    std::string error;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ArtworkFailure, type, error)
};

struct ArtworkResponse {
    std::vector<std::string> applied;
    std::vector<ArtworkFailure> failed;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ArtworkResponse, applied, failed)
};

// Header of a send_artwork_image binary frame. app_id 0 parks the image until the
// next completed upload creates the shortcut.
struct ArtworkImageHeader {
    std::string id;
    std::string user_id;
    std::uint32_t app_id = 0;
    std::string artwork_type; // grid, banner, hero, logo, icon
    std::string content_type; // image/png, image/jpeg, image/webp

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(
        ArtworkImageHeader, id, user_id, app_id, artwork_type, content_type)
};

struct ArtworkImageResponse {
    bool success = false;
    std::string artwork_type;
    std::string error;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ArtworkImageResponse, success, artwork_type, error)
};

// uploads

struct InitUploadRequest {
    UploadConfig config;
    std::uint64_t total_size = 0;
    std::vector<FileEntry> files;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(InitUploadRequest, config, total_size, files)
};

struct InitUploadResponse {
    std::string upload_id;
    std::uint64_t chunk_size = 0;
    std::map<std::string, std::uint64_t> resume_from;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(InitUploadResponse, upload_id, chunk_size, resume_from)
};

struct UploadChunkResponse {
    std::string upload_id;
    std::string file_path;
    std::uint64_t offset = 0;
    std::uint64_t bytes_written = 0;
    std::uint64_t total_received = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(
        UploadChunkResponse, upload_id, file_path, offset, bytes_written, total_received)
};

struct CompleteUploadRequest {
    std::string upload_id;
    bool create_shortcut = false;
    std::string user_id;
    std::optional<ShortcutConfig> shortcut;
};

inline void to_json(nlohmann::json& j, const CompleteUploadRequest& request) {
    j = nlohmann::json{
        {"upload_id", request.upload_id},
        {"create_shortcut", request.create_shortcut},
        {"user_id", request.user_id},
    };
    if (request.shortcut) {
        j["shortcut"] = *request.shortcut;
    }
}

inline void from_json(const nlohmann::json& j, CompleteUploadRequest& request) {
    request.upload_id = j.value("upload_id", "");
    request.create_shortcut = j.value("create_shortcut", false);
    request.user_id = j.value("user_id", "");
    if (j.contains("shortcut") && !j["shortcut"].is_null()) {
        request.shortcut = j["shortcut"].get<ShortcutConfig>();
    } else {
        request.shortcut.reset();
    }
}

// `success` is the transfer's outcome; the finalize step (making the executable
// runnable, writing the shortcut) reports separately through shortcut_created and
// finalize_error.
struct CompleteUploadResponse {
    bool success = false;
    std::string path;
    std::uint32_t app_id = 0;
    bool shortcut_created = false;
    std::string finalize_error;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(
        CompleteUploadResponse, success, path, app_id, shortcut_created, finalize_error)
};

struct CancelUploadRequest {
    std::string upload_id;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(CancelUploadRequest, upload_id)
};

} // namespace deckhand::core
