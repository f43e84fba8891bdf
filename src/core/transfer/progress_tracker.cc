#include <utility>
#include <algorithm>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/transfer/progress_tracker.h>

namespace deckhand::core {

namespace net = boost::asio;

ProgressTracker::ProgressTracker(net::any_io_executor executor,
                                 std::string upload_id,
                                 std::uint64_t total_bytes,
                                 EventQueue<UploadProgress>* sink,
                                 std::chrono::milliseconds interval)
    : timer_(executor)
    , interval_(interval)
    , sink_(sink) {
    progress_.upload_id = std::move(upload_id);
    progress_.total_bytes = total_bytes;
}

void ProgressTracker::Add(std::uint64_t bytes, const std::string& current_file) {
    speed_.AddBytes(bytes);
    std::lock_guard<std::mutex> lock(mutex_);
    progress_.transferred_bytes = std::min(progress_.transferred_bytes + bytes,
                                           progress_.total_bytes);
    progress_.current_file = current_file;
    if (progress_.status == UploadStatus::kPending) {
        progress_.status = UploadStatus::kInProgress;
    }
}

void ProgressTracker::AddResumed(std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_.transferred_bytes = std::min(progress_.transferred_bytes + bytes,
                                           progress_.total_bytes);
}

void ProgressTracker::SetUploadId(std::string upload_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_.upload_id = std::move(upload_id);
}

void ProgressTracker::SetStatus(UploadStatus status, std::string error) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_.status = status;
    progress_.error = std::move(error);
}

UploadProgress ProgressTracker::Snapshot() const {
    UploadProgress snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = progress_;
    }
    snapshot.percentage = snapshot.total_bytes == 0
                              ? 0.0
                              : static_cast<double>(snapshot.transferred_bytes) * 100.0
                                    / static_cast<double>(snapshot.total_bytes);
    snapshot.speed_bps = speed_.BytesPerSecond();
    snapshot.eta_seconds = speed_.EtaSeconds(snapshot.total_bytes - snapshot.transferred_bytes);
    return snapshot;
}

void ProgressTracker::publish() {
    if (sink_ != nullptr) {
        sink_->TryPush(Snapshot());
    }
}

net::awaitable<void> ProgressTracker::Run() {
    while (!stopped_) {
        timer_.expires_after(interval_);
        boost::system::error_code ec;
        co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (stopped_) {
            break;
        }
        publish();
    }
}

void ProgressTracker::Stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    timer_.cancel();
    publish();
}

} // namespace deckhand::core
