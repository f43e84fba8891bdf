#pragma once

#include <chrono>
#include <core/model/upload.h>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace deckhand::core {

// One upload on the receiving side.
//
// pending -> in_progress -> {completed | failed | cancelled}; terminal states are final.
// The transferred counter only grows, counts each byte of a file at most once (a
// retried chunk is not counted again) and never exceeds the declared total.
class UploadSession {
public:
    using Clock = std::chrono::system_clock;

    UploadSession(std::string id,
                  UploadConfig config,
                  std::vector<FileEntry> files,
                  std::uint64_t total_bytes);

    const std::string& id() const { return id_; }
    const UploadConfig& config() const { return config_; }
    const std::vector<FileEntry>& files() const { return files_; }
    std::uint64_t total_bytes() const { return total_bytes_; }

    UploadStatus status() const;
    std::string error() const;
    std::uint64_t transferred_bytes() const;
    bool IsActive() const;

    // Bytes of a file that are already present, counted as transferred
    void MarkResumed(const std::string& file_path, std::uint64_t bytes);
    std::map<std::string, std::uint64_t> resume_offsets() const;

    // Checks that a chunk fits the manifest; throws TransferError otherwise
    void ValidateChunk(const std::string& file_path,
                       std::uint64_t offset,
                       std::uint64_t size) const;

    // Records an applied chunk and returns how many bytes were newly counted
    std::uint64_t RecordChunk(const std::string& file_path, std::uint64_t offset, std::uint64_t size);

    bool Start();
    bool Complete();
    bool Fail(const std::string& error);
    bool Cancel();

    UploadProgress Progress() const;

    Clock::time_point created_at() const { return created_at_; }
    Clock::time_point updated_at() const;

private:
    bool transition(UploadStatus to, const std::string& error = {});
    std::uint64_t cover(const std::string& file_path, std::uint64_t begin, std::uint64_t end);

    const std::string id_;
    const UploadConfig config_;
    const std::vector<FileEntry> files_;
    const std::uint64_t total_bytes_;
    std::map<std::string, std::uint64_t> file_sizes_;

    mutable std::mutex mutex_;
    UploadStatus status_{UploadStatus::kPending};
    std::string error_;
    std::uint64_t transferred_{0};
    std::string current_file_;
    // per file: begin -> end of the byte ranges already applied, non-overlapping
    std::map<std::string, std::map<std::uint64_t, std::uint64_t>> covered_;
    std::map<std::string, std::uint64_t> resume_offsets_;
    Clock::time_point created_at_;
    Clock::time_point updated_at_;
};

} // namespace deckhand::core
