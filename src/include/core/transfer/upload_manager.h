#pragma once

#include <core/constant/transfer.h>
#include <core/model/upload.h>
#include <core/transfer/chunk.h>
#include <core/transfer/speed_calculator.h>
#include <core/transfer/upload_session.h>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace deckhand::core {

// Registry of the uploads an agent is receiving. Finished sessions leave the active
// map but stay inspectable for a while, so a hub that asks late still sees why an
// upload failed.
class UploadManager {
public:
    explicit UploadManager(std::filesystem::path install_dir,
                           std::uint64_t chunk_size = transfer::kDefaultChunkSize);
    UploadManager(const UploadManager&) = delete;
    UploadManager& operator=(const UploadManager&) = delete;

    // Creates a session. Bytes already on disk from an earlier attempt are reported
    // through the session's resume offsets and count as transferred.
    std::shared_ptr<UploadSession> Init(UploadConfig config,
                                        std::uint64_t total_bytes,
                                        std::vector<FileEntry> files);

    // Verifies and writes one chunk. A checksum mismatch rejects the chunk but
    // leaves the session running; an I/O error fails the session.
    UploadProgress WriteChunk(const std::string& upload_id, const Chunk& chunk);

    // Marks the transfer completed once every byte arrived
    std::shared_ptr<UploadSession> Complete(const std::string& upload_id);

    // Cancels the session. Written files stay on disk for a later resume.
    void Cancel(const std::string& upload_id);

    // Active or recently finished session
    std::shared_ptr<UploadSession> Get(const std::string& upload_id) const;
    std::vector<UploadProgress> ActiveUploads() const;

    std::filesystem::path GameDir(const UploadConfig& config) const;
    const std::filesystem::path& install_dir() const { return install_dir_; }
    std::uint64_t chunk_size() const { return chunk_size_; }

private:
    struct Entry {
        std::shared_ptr<UploadSession> session;
        std::shared_ptr<SpeedCalculator> speed;
    };

    Entry activeEntry(const std::string& upload_id) const;
    void retire(const std::string& upload_id);

    static constexpr std::size_t kFinishedHistory = 32;

    const std::filesystem::path install_dir_;
    const std::uint64_t chunk_size_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> active_;
    std::unordered_map<std::string, std::shared_ptr<UploadSession>> finished_;
    std::deque<std::string> finished_order_;
};

} // namespace deckhand::core
