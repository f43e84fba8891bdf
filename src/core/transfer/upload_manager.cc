#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/transfer/chunk_writer.h>
#include <core/transfer/transfer_error.h>
#include <core/transfer/upload_manager.h>
#include <mutex>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace deckhand::core {

namespace {

void validateGameName(const std::string& name) {
    if (name.empty()) {
        throw TransferError(TransferErrorKind::kInvalidPath, "game name is required");
    }
    if (name == "." || name == ".." || name.find('/') != std::string::npos
        || name.find('\\') != std::string::npos) {
        throw TransferError(TransferErrorKind::kInvalidPath, "invalid game name: " + name);
    }
}

} // namespace

UploadManager::UploadManager(std::filesystem::path install_dir, std::uint64_t chunk_size)
    : install_dir_(std::move(install_dir))
    , chunk_size_(chunk_size == 0 ? transfer::kDefaultChunkSize : chunk_size) {}

std::filesystem::path UploadManager::GameDir(const UploadConfig& config) const {
    validateGameName(config.game_name);
    std::filesystem::path base = config.install_path.empty()
                                     ? install_dir_
                                     : std::filesystem::path(config.install_path);
    return base / config.game_name;
}

std::shared_ptr<UploadSession> UploadManager::Init(UploadConfig config,
                                                   std::uint64_t total_bytes,
                                                   std::vector<FileEntry> files) {
    auto game_dir = GameDir(config);
    ChunkWriter writer(game_dir);

    std::unordered_set<std::string> seen;
    std::uint64_t declared = 0;
    for (const auto& file : files) {
        ResolveUploadPath(game_dir, file.relative_path);
        if (!seen.insert(file.relative_path).second) {
            throw TransferError(TransferErrorKind::kInvalidPath,
                                "duplicate file in manifest",
                                file.relative_path);
        }
        declared += file.size;
    }
    if (declared != total_bytes) {
        throw TransferError(TransferErrorKind::kBadManifest,
                            "declared total of " + std::to_string(total_bytes)
                                + " bytes does not match the files (" + std::to_string(declared)
                                + " bytes)");
    }

    auto id = boost::uuids::to_string(boost::uuids::random_generator()());
    auto session = std::make_shared<UploadSession>(id, std::move(config), files, total_bytes);
    for (const auto& file : files) {
        auto existing = writer.ExistingSize(file.relative_path);
        if (existing > 0) {
            session->MarkResumed(file.relative_path, std::min(existing, file.size));
        }
    }

    {
        std::unique_lock lock(mutex_);
        active_[id] = Entry{session, std::make_shared<SpeedCalculator>()};
    }
    spdlog::info("Upload session {} created for '{}' ({} bytes, {} files, {} resumable)",
                 id,
                 session->config().game_name,
                 total_bytes,
                 session->files().size(),
                 session->resume_offsets().size());
    return session;
}

UploadManager::Entry UploadManager::activeEntry(const std::string& upload_id) const {
    std::shared_lock lock(mutex_);
    auto it = active_.find(upload_id);
    if (it != active_.end()) {
        return it->second;
    }
    if (finished_.contains(upload_id)) {
        throw TransferError(TransferErrorKind::kNotActive, "upload is not active: " + upload_id);
    }
    throw TransferError(TransferErrorKind::kNotFound, "upload not found: " + upload_id);
}

void UploadManager::retire(const std::string& upload_id) {
    std::unique_lock lock(mutex_);
    auto it = active_.find(upload_id);
    if (it == active_.end()) {
        return;
    }
    finished_[upload_id] = it->second.session;
    finished_order_.push_back(upload_id);
    active_.erase(it);
    while (finished_order_.size() > kFinishedHistory) {
        finished_.erase(finished_order_.front());
        finished_order_.pop_front();
    }
}

UploadProgress UploadManager::WriteChunk(const std::string& upload_id, const Chunk& chunk) {
    auto entry = activeEntry(upload_id);
    auto& session = entry.session;
    if (!session->IsActive()) {
        throw TransferError(TransferErrorKind::kNotActive, "upload is not active: " + upload_id);
    }
    session->ValidateChunk(chunk.file_path, chunk.offset, chunk.size());

    try {
        ChunkWriter(GameDir(session->config())).WriteChunk(chunk);
    } catch (const TransferError& e) {
        if (e.kind() != TransferErrorKind::kChecksumMismatch) {
            session->Fail(e.what());
            retire(upload_id);
            spdlog::error("Upload {} failed at {}:{}: {}",
                          upload_id,
                          e.file(),
                          e.offset(),
                          e.what());
        }
        throw;
    }

    auto added = session->RecordChunk(chunk.file_path, chunk.offset, chunk.size());
    entry.speed->AddBytes(added);

    auto progress = session->Progress();
    progress.speed_bps = entry.speed->BytesPerSecond();
    progress.eta_seconds = entry.speed->EtaSeconds(progress.total_bytes
                                                   - progress.transferred_bytes);
    return progress;
}

std::shared_ptr<UploadSession> UploadManager::Complete(const std::string& upload_id) {
    auto entry = activeEntry(upload_id);
    auto& session = entry.session;
    auto transferred = session->transferred_bytes();
    if (transferred < session->total_bytes()) {
        throw TransferError(TransferErrorKind::kIncomplete,
                            "upload incomplete: " + std::to_string(transferred) + " of "
                                + std::to_string(session->total_bytes()) + " bytes");
    }
    if (!session->Complete()) {
        throw TransferError(TransferErrorKind::kNotActive, "upload is not active: " + upload_id);
    }
    retire(upload_id);
    spdlog::info("Upload {} completed ({} bytes)", upload_id, transferred);
    return session;
}

void UploadManager::Cancel(const std::string& upload_id) {
    auto entry = activeEntry(upload_id);
    entry.session->Cancel();
    retire(upload_id);
    spdlog::info("Upload {} cancelled, partial files kept", upload_id);
}

std::shared_ptr<UploadSession> UploadManager::Get(const std::string& upload_id) const {
    std::shared_lock lock(mutex_);
    if (auto it = active_.find(upload_id); it != active_.end()) {
        return it->second.session;
    }
    if (auto it = finished_.find(upload_id); it != finished_.end()) {
        return it->second;
    }
    return nullptr;
}

std::vector<UploadProgress> UploadManager::ActiveUploads() const {
    std::vector<std::shared_ptr<UploadSession>> sessions;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, entry] : active_) {
            sessions.push_back(entry.session);
        }
    }
    std::vector<UploadProgress> progress;
    for (const auto& session : sessions) {
        progress.push_back(session->Progress());
    }
    return progress;
}

} // namespace deckhand::core
