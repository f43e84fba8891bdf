#include <algorithm>
#include <core/constant/transfer.h>
#include <core/network/server/message_handler.h>
#include <core/steam/artwork.h>
#include <core/steam/shortcuts.h>
#include <core/steam/vdf.h>
#include <core/transfer/chunk.h>
#include <core/transfer/chunk_writer.h>
#include <core/transfer/transfer_error.h>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <utility>

namespace fs = std::filesystem;

namespace deckhand::core {

namespace {

// A request the agent refuses, with the code the hub sees
class RequestError : public std::runtime_error {
public:
    RequestError(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

ErrorCode codeFor(TransferErrorKind kind) {
    switch (kind) {
    case TransferErrorKind::kChecksumMismatch:
        return ErrorCode::kChecksumMismatch;
    case TransferErrorKind::kNotFound:
        return ErrorCode::kNotFound;
    case TransferErrorKind::kInvalidPath:
    case TransferErrorKind::kOverflow:
    case TransferErrorKind::kBadManifest:
        return ErrorCode::kBadRequest;
    case TransferErrorKind::kNotActive:
    case TransferErrorKind::kIncomplete:
        return ErrorCode::kConflict;
    case TransferErrorKind::kIo:
        break;
    }
    return ErrorCode::kInternal;
}

// Runs `fn` and turns whatever it throws into an error reply to `request`
template <typename Fn>
Message guarded(const Message& request, Fn&& fn) {
    try {
        return fn();
    } catch (const RequestError& e) {
        return request.ErrorReply(e.code(), e.what());
    } catch (const ProtocolError& e) {
        spdlog::warn("Bad {} request: {}", ToString(request.type), e.what());
        return request.ErrorReply(ErrorCode::kBadRequest, e.what());
    } catch (const TransferError& e) {
        spdlog::warn("{} failed: {}", ToString(request.type), e.what());
        return request.ErrorReply(codeFor(e.kind()), e.what());
    } catch (const VdfError& e) {
        spdlog::error("Shortcuts database error at offset {}: {}", e.offset(), e.what());
        return request.ErrorReply(ErrorCode::kInternal, e.what());
    } catch (const std::invalid_argument& e) {
        return request.ErrorReply(ErrorCode::kBadRequest, e.what());
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", ToString(request.type), e.what());
        return request.ErrorReply(ErrorCode::kInternal, e.what());
    }
}

std::string unquote(std::string value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

bool isWithin(const fs::path& dir, const fs::path& base) {
    auto relative = dir.lexically_normal().lexically_relative(base.lexically_normal());
    return !relative.empty() && *relative.begin() != ".." && relative != ".";
}

template <typename T>
T headerAs(const nlohmann::json& header) {
    try {
        return header.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ProtocolError(std::string("invalid binary frame header: ") + e.what());
    }
}

} // namespace

MessageHandler::MessageHandler(AgentContext& agent, EventSink& events)
    : agent_(agent)
    , events_(events) {}

std::optional<Message> MessageHandler::Handle(const Message& request) {
    auto message_class = ClassOf(request.type);
    if (message_class == MessageClass::kResponse || message_class == MessageClass::kEvent) {
        spdlog::debug("Ignoring {} from hub", ToString(request.type));
        return std::nullopt;
    }
    return guarded(request, [&] { return dispatch(request); });
}

Message MessageHandler::dispatch(const Message& request) {
    switch (request.type) {
    case MessageType::kHubConnected:
        return handleHubConnected(request);
    case MessageType::kPairConfirm:
        return handlePairConfirm(request);
    case MessageType::kPing:
        return request.Reply(MessageType::kPong);
    default:
        break;
    }

    if (!authorized_) {
        throw RequestError(ErrorCode::kUnauthorized, "hub is not paired");
    }

    switch (request.type) {
    case MessageType::kGetInfo:
        return handleGetInfo(request);
    case MessageType::kGetConfig:
        return handleGetConfig(request);
    case MessageType::kGetSteamUsers:
        return handleGetSteamUsers(request);
    case MessageType::kListShortcuts:
        return handleListShortcuts(request);
    case MessageType::kCreateShortcut:
        return handleCreateShortcut(request);
    case MessageType::kDeleteShortcut:
        return handleDeleteShortcut(request);
    case MessageType::kDeleteGame:
        return handleDeleteGame(request);
    case MessageType::kApplyArtwork:
        return handleApplyArtwork(request);
    case MessageType::kInitUpload:
        return handleInitUpload(request);
    case MessageType::kCompleteUpload:
        return handleCompleteUpload(request);
    case MessageType::kCancelUpload:
        return handleCancelUpload(request);
    case MessageType::kUploadChunk:
    case MessageType::kSendArtworkImage:
        throw RequestError(ErrorCode::kBadRequest,
                           ToString(request.type) + " must be sent as a binary frame");
    default:
        break;
    }
    throw RequestError(ErrorCode::kNotImplemented,
                       "unsupported message type: " + ToString(request.type));
}

Message MessageHandler::HandleBinary(std::span<const std::uint8_t> data) {
    auto frame = ParseBinaryMessage(data);
    if (!frame) {
        return Message::Create({}, MessageType::kUnknown)
            .ErrorReply(ErrorCode::kBadRequest, "malformed binary frame");
    }

    auto type = frame->header.value("type", std::string());
    Message request = Message::Create(frame->header.value("id", std::string()),
                                      nlohmann::json(type).get<MessageType>());
    return guarded(request, [&] {
        if (!authorized_) {
            throw RequestError(ErrorCode::kUnauthorized, "hub is not paired");
        }
        switch (request.type) {
        case MessageType::kUploadChunk:
            return handleChunk(request, std::move(*frame));
        case MessageType::kSendArtworkImage:
            return handleArtworkImage(request, std::move(*frame));
        default:
            break;
        }
        throw RequestError(ErrorCode::kBadRequest, "unexpected binary frame type: " + type);
    });
}

// handshake

Message MessageHandler::handleHubConnected(const Message& request) {
    auto hello = request.PayloadAs<HubConnectedRequest>();
    if (hello.hub_id.empty()) {
        throw RequestError(ErrorCode::kBadRequest, "hub_id is required");
    }
    if (!agent_.info.accept_connections) {
        throw RequestError(ErrorCode::kNotAccepted, "agent is not accepting connections");
    }

    hub_ = HubIdentity{hello.hub_id, hello.name, hello.platform, hello.version};
    authorized_ = agent_.pairing.ValidateToken(hello.hub_id, hello.token);
    if (authorized_) {
        spdlog::info("Hub {} ({}) connected", hello.name, hello.hub_id);
        return request.Reply(MessageType::kAgentStatus, agent_.info);
    }

    spdlog::info("Hub {} ({}) is not paired, starting pairing", hello.name, hello.hub_id);
    try {
        agent_.pairing.GenerateCode(hello.hub_id, hello.name, hello.platform);
    } catch (const PairingError& e) {
        return request.Reply(MessageType::kPairFailed, PairFailedResponse{e.reason_string()});
    }
    return request.Reply(MessageType::kPairingRequired,
                         PairingRequiredResponse{agent_.pairing.ExpiresIn().count()});
}

Message MessageHandler::handlePairConfirm(const Message& request) {
    if (!hub_) {
        throw RequestError(ErrorCode::kBadRequest, "hub_connected must come first");
    }
    auto confirm = request.PayloadAs<PairConfirmRequest>();
    try {
        auto token = agent_.pairing.ValidateCode(hub_->hub_id, confirm.code);
        authorized_ = true;
        return request.Reply(MessageType::kPairSuccess, PairSuccessResponse{token, agent_.info.id});
    } catch (const PairingError& e) {
        spdlog::warn("Pairing with hub {} failed: {}", hub_->hub_id, e.what());
        return request.Reply(MessageType::kPairFailed, PairFailedResponse{e.reason_string()});
    }
}

// queries

Message MessageHandler::handleGetInfo(const Message& request) {
    return request.Reply(MessageType::kInfoResponse, InfoResponse{agent_.info});
}

Message MessageHandler::handleGetConfig(const Message& request) {
    return request.Reply(MessageType::kConfigResponse,
                         ConfigResponse{agent_.uploads.install_dir().string(),
                                        agent_.uploads.chunk_size()});
}

Message MessageHandler::handleGetSteamUsers(const Message& request) {
    SteamUsersResponse response;
    for (const auto& user : steam().Users()) {
        response.users.push_back(SteamUserInfo{user.id});
    }
    return request.Reply(MessageType::kSteamUsersResponse, response);
}

const SteamPaths& MessageHandler::steam() const {
    if (!agent_.steam) {
        throw RequestError(ErrorCode::kNotFound, "no Steam installation found");
    }
    return *agent_.steam;
}

void MessageHandler::requireUser(const std::string& user_id) const {
    if (user_id.empty()
        || !std::all_of(user_id.begin(), user_id.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw RequestError(ErrorCode::kBadRequest, "invalid Steam user id: " + user_id);
    }
    if (!fs::is_directory(steam().UserDataDir(user_id))) {
        throw RequestError(ErrorCode::kNotFound, "unknown Steam user: " + user_id);
    }
}

// shortcuts

Message MessageHandler::handleListShortcuts(const Message& request) {
    auto list = request.PayloadAs<ListShortcutsRequest>();
    requireUser(list.user_id);

    ShortcutsResponse response;
    ShortcutsFile file(steam().ShortcutsPath(list.user_id));
    try {
        std::lock_guard<std::mutex> lock(agent_.library_mutex);
        file.Load();
    } catch (const VdfError& e) {
        spdlog::warn("Unreadable shortcuts database {}: {}", file.path().string(), e.what());
        response.warning = e.what();
        return request.Reply(MessageType::kShortcutsResponse, response);
    }
    for (const auto& entry : file.entries()) {
        response.shortcuts.push_back(ShortcutInfo::FromEntry(entry));
    }
    return request.Reply(MessageType::kShortcutsResponse, response);
}

std::uint32_t MessageHandler::createShortcut(const std::string& user_id,
                                             const ShortcutConfig& config) {
    if (config.name.empty() || config.exe.empty()) {
        throw RequestError(ErrorCode::kBadRequest, "shortcut needs a name and an executable");
    }
    std::lock_guard<std::mutex> lock(agent_.library_mutex);
    ShortcutsFile file(steam().ShortcutsPath(user_id));
    file.Load();
    auto app_id = file.Add(MakeShortcutEntry(config));
    file.Save();
    spdlog::info("Shortcut {} ({}) written for user {}", config.name, app_id, user_id);
    return app_id;
}

Message MessageHandler::handleCreateShortcut(const Message& request) {
    auto create = request.PayloadAs<CreateShortcutRequest>();
    requireUser(create.user_id);

    auto app_id = createShortcut(create.user_id, create.shortcut);
    OperationResult result{true, "shortcut created", app_id};
    if (create.shortcut.artwork) {
        auto artwork = applyArtwork(create.user_id, app_id, *create.shortcut.artwork);
        if (!artwork.failed.empty()) {
            result.message = "shortcut created, some artwork failed";
        }
    }
    return request.Reply(MessageType::kOperationResult, result);
}

Message MessageHandler::handleDeleteShortcut(const Message& request) {
    auto remove = request.PayloadAs<DeleteShortcutRequest>();
    requireUser(remove.user_id);

    std::lock_guard<std::mutex> lock(agent_.library_mutex);
    ShortcutsFile file(steam().ShortcutsPath(remove.user_id));
    file.Load();
    if (!file.Remove(remove.app_id)) {
        throw RequestError(ErrorCode::kNotFound,
                           "no shortcut with app id " + std::to_string(remove.app_id));
    }
    file.Save();
    artwork::RemoveAll(steam().GridDir(remove.user_id), remove.app_id);
    return request.Reply(MessageType::kOperationResult,
                         OperationResult{true, "shortcut deleted", remove.app_id});
}

Message MessageHandler::handleDeleteGame(const Message& request) {
    auto remove = request.PayloadAs<DeleteGameRequest>();
    requireUser(remove.user_id);

    std::lock_guard<std::mutex> lock(agent_.library_mutex);
    ShortcutsFile file(steam().ShortcutsPath(remove.user_id));
    file.Load();
    auto entry = file.Find(remove.app_id);
    if (!entry) {
        throw RequestError(ErrorCode::kNotFound,
                           "no shortcut with app id " + std::to_string(remove.app_id));
    }

    publishOperation(OperationKind::kDelete, OperationStatus::kStart, entry->name, 0);
    try {
        file.Remove(remove.app_id);
        file.Save();
        artwork::RemoveAll(steam().GridDir(remove.user_id), remove.app_id);
        publishOperation(OperationKind::kDelete, OperationStatus::kProgress, entry->name, 50);

        fs::path game_dir = unquote(entry->start_dir);
        if (!game_dir.empty() && isWithin(game_dir, agent_.uploads.install_dir())) {
            auto removed = fs::remove_all(game_dir);
            spdlog::info("Removed {} ({} entries)", game_dir.string(), removed);
        } else {
            spdlog::info("Leaving {} in place, it is outside the install directory",
                         game_dir.string());
        }
    } catch (const std::exception& e) {
        publishOperation(OperationKind::kDelete, OperationStatus::kError, entry->name, 0, e.what());
        throw;
    }
    publishOperation(OperationKind::kDelete, OperationStatus::kComplete, entry->name, 100);
    return request.Reply(MessageType::kOperationResult,
                         OperationResult{true, "game deleted", remove.app_id});
}

// artwork

ArtworkResponse MessageHandler::applyArtwork(const std::string& user_id,
                                             std::uint32_t app_id,
                                             const ArtworkConfig& artwork) {
    const std::pair<std::string_view, const std::string*> images[] = {
        {"grid", &artwork.grid},
        {"banner", &artwork.banner},
        {"hero", &artwork.hero},
        {"logo", &artwork.logo},
        {"icon", &artwork.icon},
    };

    ArtworkResponse response;
    auto grid_dir = steam().GridDir(user_id);
    std::lock_guard<std::mutex> lock(agent_.library_mutex);
    for (const auto& [type, source] : images) {
        if (source->empty()) {
            continue;
        }
        try {
            artwork::ApplyFromFile(grid_dir, app_id, type, *source);
            response.applied.emplace_back(type);
        } catch (const std::exception& e) {
            spdlog::warn("Artwork {} for {} not applied: {}", type, app_id, e.what());
            response.failed.push_back(ArtworkFailure{std::string(type), e.what()});
        }
    }
    return response;
}

Message MessageHandler::handleApplyArtwork(const Message& request) {
    auto apply = request.PayloadAs<ApplyArtworkRequest>();
    requireUser(apply.user_id);
    if (apply.app_id == 0) {
        throw RequestError(ErrorCode::kBadRequest, "app_id is required");
    }
    return request.Reply(MessageType::kArtworkResponse,
                         applyArtwork(apply.user_id, apply.app_id, apply.artwork));
}

Message MessageHandler::handleArtworkImage(const Message& request, ParsedBinaryMessage frame) {
    auto header = headerAs<ArtworkImageHeader>(frame.header);
    if (!artwork::Suffix(header.artwork_type)) {
        throw RequestError(ErrorCode::kBadRequest, "unknown artwork type: " + header.artwork_type);
    }
    if (!artwork::ExtensionFromContentType(header.content_type)) {
        throw RequestError(ErrorCode::kBadRequest,
                           "unsupported content type: " + header.content_type);
    }

    ArtworkImageResponse response;
    response.artwork_type = header.artwork_type;
    if (header.app_id == 0) {
        // no shortcut yet, applied when the next upload completes
        parked_artwork_.push_back(ParkedArtwork{header.user_id,
                                                header.artwork_type,
                                                header.content_type,
                                                std::move(frame.data)});
        response.success = true;
        return request.Reply(MessageType::kArtworkImageResponse, response);
    }

    requireUser(header.user_id);
    std::lock_guard<std::mutex> lock(agent_.library_mutex);
    artwork::ApplyFromData(steam().GridDir(header.user_id),
                           header.app_id,
                           header.artwork_type,
                           header.content_type,
                           frame.data);
    response.success = true;
    return request.Reply(MessageType::kArtworkImageResponse, response);
}

void MessageHandler::applyParkedArtwork(const std::string& user_id, std::uint32_t app_id) {
    if (parked_artwork_.empty()) {
        return;
    }
    auto grid_dir = steam().GridDir(user_id);
    std::lock_guard<std::mutex> lock(agent_.library_mutex);
    for (const auto& image : parked_artwork_) {
        if (!image.user_id.empty() && image.user_id != user_id) {
            continue;
        }
        try {
            artwork::ApplyFromData(grid_dir, app_id, image.artwork_type, image.content_type, image.data);
        } catch (const std::exception& e) {
            spdlog::warn("Parked {} artwork not applied to {}: {}", image.artwork_type, app_id, e.what());
        }
    }
    std::erase_if(parked_artwork_, [&](const ParkedArtwork& image) {
        return image.user_id.empty() || image.user_id == user_id;
    });
}

// uploads

Message MessageHandler::handleInitUpload(const Message& request) {
    auto init = request.PayloadAs<InitUploadRequest>();
    auto session = agent_.uploads.Init(init.config, init.total_size, std::move(init.files));
    upload_ids_.push_back(session->id());
    publishOperation(OperationKind::kInstall, OperationStatus::kStart, init.config.game_name, 0);
    return request.Reply(MessageType::kUploadInitResponse,
                         InitUploadResponse{session->id(),
                                            agent_.uploads.chunk_size(),
                                            session->resume_offsets()});
}

Message MessageHandler::handleChunk(const Message& request, ParsedBinaryMessage frame) {
    auto header = headerAs<ChunkHeader>(frame.header);
    Chunk chunk{header.file_path, header.offset, std::move(frame.data), header.checksum};

    UploadProgress progress;
    try {
        progress = agent_.uploads.WriteChunk(header.upload_id, chunk);
    } catch (const TransferError& e) {
        if (e.kind() != TransferErrorKind::kChecksumMismatch) {
            if (auto session = agent_.uploads.Get(header.upload_id)) {
                publishProgress(session->Progress(), true);
                publishOperation(OperationKind::kInstall,
                                 OperationStatus::kError,
                                 session->config().game_name,
                                 0,
                                 e.what());
            }
        }
        throw;
    }
    publishProgress(progress, false);

    return request.Reply(MessageType::kUploadChunkResponse,
                         UploadChunkResponse{header.upload_id,
                                             header.file_path,
                                             header.offset,
                                             chunk.size(),
                                             progress.transferred_bytes});
}

Message MessageHandler::handleCompleteUpload(const Message& request) {
    auto complete = request.PayloadAs<CompleteUploadRequest>();
    auto session = agent_.uploads.Complete(complete.upload_id);
    const auto& config = session->config();
    auto game_dir = agent_.uploads.GameDir(config);
    publishProgress(session->Progress(), true);
    last_progress_.erase(complete.upload_id);

    CompleteUploadResponse response;
    response.success = true;
    response.path = game_dir.string();

    try {
        fs::path exe;
        if (!config.executable.empty()) {
            exe = ResolveUploadPath(game_dir, config.executable);
            fs::permissions(exe,
                            fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec
                                | fs::perms::others_read | fs::perms::others_exec,
                            fs::perm_options::replace);
        }

        if (complete.create_shortcut) {
            requireUser(complete.user_id);
            ShortcutConfig shortcut = complete.shortcut.value_or(ShortcutConfig{});
            if (shortcut.name.empty()) {
                shortcut.name = config.game_name;
            }
            if (shortcut.exe.empty()) {
                shortcut.exe = exe.string();
            }
            if (shortcut.start_dir.empty()) {
                shortcut.start_dir = game_dir.string();
            }
            if (shortcut.launch_options.empty()) {
                shortcut.launch_options = config.launch_options;
            }
            if (shortcut.tags.empty()) {
                shortcut.tags = config.tags;
            }
            response.app_id = createShortcut(complete.user_id, shortcut);
            response.shortcut_created = true;
            if (shortcut.artwork) {
                applyArtwork(complete.user_id, response.app_id, *shortcut.artwork);
            }
            applyParkedArtwork(complete.user_id, response.app_id);
        }
        publishOperation(OperationKind::kInstall, OperationStatus::kComplete, config.game_name, 100);
    } catch (const std::exception& e) {
        spdlog::error("Upload {} arrived but finalizing failed: {}", session->id(), e.what());
        response.finalize_error = e.what();
        publishOperation(OperationKind::kInstall,
                         OperationStatus::kError,
                         config.game_name,
                         100,
                         e.what());
    }
    return request.Reply(MessageType::kUploadCompleteResponse, response);
}

Message MessageHandler::handleCancelUpload(const Message& request) {
    auto cancel = request.PayloadAs<CancelUploadRequest>();
    agent_.uploads.Cancel(cancel.upload_id);
    last_progress_.erase(cancel.upload_id);
    if (auto session = agent_.uploads.Get(cancel.upload_id)) {
        publishProgress(session->Progress(), true);
    }
    return request.Reply(MessageType::kOperationResult, OperationResult{true, "upload cancelled", 0});
}

void MessageHandler::Disconnected() {
    for (const auto& id : upload_ids_) {
        auto session = agent_.uploads.Get(id);
        if (!session || !session->IsActive()) {
            continue;
        }
        try {
            agent_.uploads.Cancel(id);
        } catch (const TransferError& e) {
            spdlog::warn("Failed to cancel upload {} of a disconnected hub: {}", id, e.what());
        }
    }
    upload_ids_.clear();
    last_progress_.clear();
    parked_artwork_.clear();

    if (hub_ && !authorized_) {
        agent_.pairing.CancelPending(hub_->hub_id);
    }
}

// events

void MessageHandler::publishProgress(const UploadProgress& progress, bool force) {
    auto now = std::chrono::steady_clock::now();
    auto& last = last_progress_[progress.upload_id];
    if (!force && now - last < transfer::kProgressInterval) {
        return;
    }
    last = now;
    events_.Publish(Message::Create(Message::NewId(), MessageType::kUploadProgress, progress));
}

void MessageHandler::publishOperation(OperationKind kind,
                                      OperationStatus status,
                                      const std::string& game_name,
                                      double progress,
                                      std::string message) {
    events_.Publish(Message::Create(Message::NewId(),
                                    MessageType::kOperationEvent,
                                    OperationEvent{kind, status, game_name, progress, std::move(message)}));
}

} // namespace deckhand::core
