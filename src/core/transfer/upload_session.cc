#include <algorithm>
#include <iterator>
#include <core/transfer/transfer_error.h>
#include <core/transfer/upload_session.h>

namespace deckhand::core {

UploadSession::UploadSession(std::string id,
                             UploadConfig config,
                             std::vector<FileEntry> files,
                             std::uint64_t total_bytes)
    : id_(std::move(id))
    , config_(std::move(config))
    , files_(std::move(files))
    , total_bytes_(total_bytes)
    , created_at_(Clock::now())
    , updated_at_(created_at_) {
    for (const auto& file : files_) {
        file_sizes_[file.relative_path] = file.size;
    }
}

UploadStatus UploadSession::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::string UploadSession::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::uint64_t UploadSession::transferred_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transferred_;
}

bool UploadSession::IsActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !IsTerminal(status_);
}

UploadSession::Clock::time_point UploadSession::updated_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return updated_at_;
}

void UploadSession::MarkResumed(const std::string& file_path, std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = file_sizes_.find(file_path);
    if (it == file_sizes_.end() || bytes == 0) {
        return;
    }
    bytes = std::min(bytes, it->second);
    resume_offsets_[file_path] = bytes;
    cover(file_path, 0, bytes);
}

std::map<std::string, std::uint64_t> UploadSession::resume_offsets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resume_offsets_;
}

void UploadSession::ValidateChunk(const std::string& file_path,
                                  std::uint64_t offset,
                                  std::uint64_t size) const {
    auto it = file_sizes_.find(file_path);
    if (it == file_sizes_.end()) {
        throw TransferError(TransferErrorKind::kInvalidPath,
                            "file is not part of the upload",
                            file_path,
                            offset);
    }
    if (offset > it->second || size > it->second - offset) {
        throw TransferError(TransferErrorKind::kOverflow,
                            "chunk exceeds the declared file size",
                            file_path,
                            offset);
    }
}

std::uint64_t UploadSession::RecordChunk(const std::string& file_path,
                                         std::uint64_t offset,
                                         std::uint64_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (IsTerminal(status_)) {
        throw TransferError(TransferErrorKind::kNotActive, "upload is not active", file_path, offset);
    }
    if (status_ == UploadStatus::kPending) {
        status_ = UploadStatus::kInProgress;
    }
    current_file_ = file_path;
    updated_at_ = Clock::now();
    return size == 0 ? 0 : cover(file_path, offset, offset + size);
}

// mutex_ must be held
std::uint64_t UploadSession::cover(const std::string& file_path,
                                   std::uint64_t begin,
                                   std::uint64_t end) {
    auto& ranges = covered_[file_path];
    std::uint64_t already = 0;

    // merge with every range touching [begin, end)
    auto it = ranges.upper_bound(begin);
    if (it != ranges.begin()) {
        auto prev = std::prev(it);
        if (prev->second >= begin) {
            it = prev;
        }
    }
    std::uint64_t merged_begin = begin;
    std::uint64_t merged_end = end;
    while (it != ranges.end() && it->first <= end) {
        auto overlap_begin = std::max(it->first, begin);
        auto overlap_end = std::min(it->second, end);
        if (overlap_end > overlap_begin) {
            already += overlap_end - overlap_begin;
        }
        merged_begin = std::min(merged_begin, it->first);
        merged_end = std::max(merged_end, it->second);
        it = ranges.erase(it);
    }
    ranges[merged_begin] = merged_end;

    std::uint64_t added = (end - begin) - already;
    added = std::min(added, total_bytes_ - std::min(transferred_, total_bytes_));
    transferred_ += added;
    return added;
}

bool UploadSession::transition(UploadStatus to, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (IsTerminal(status_)) {
        return false;
    }
    if (to == UploadStatus::kPending
        || (to == UploadStatus::kInProgress && status_ != UploadStatus::kPending)) {
        return false;
    }
    status_ = to;
    error_ = error;
    updated_at_ = Clock::now();
    return true;
}

bool UploadSession::Start() {
    return transition(UploadStatus::kInProgress);
}

bool UploadSession::Complete() {
    return transition(UploadStatus::kCompleted);
}

bool UploadSession::Fail(const std::string& error) {
    return transition(UploadStatus::kFailed, error);
}

bool UploadSession::Cancel() {
    return transition(UploadStatus::kCancelled);
}

UploadProgress UploadSession::Progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    UploadProgress progress;
    progress.upload_id = id_;
    progress.status = status_;
    progress.total_bytes = total_bytes_;
    progress.transferred_bytes = transferred_;
    progress.current_file = current_file_;
    progress.percentage = total_bytes_ == 0
                              ? (status_ == UploadStatus::kCompleted ? 100.0 : 0.0)
                              : static_cast<double>(transferred_) * 100.0
                                    / static_cast<double>(total_bytes_);
    progress.error = error_;
    return progress;
}

} // namespace deckhand::core
