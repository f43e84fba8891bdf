#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <core/constant/transfer.h>
#include <core/model/upload.h>
#include <core/transfer/speed_calculator.h>
#include <core/util/event_queue.h>
#include <cstdint>
#include <mutex>
#include <string>

namespace deckhand::core {

// Accumulates sent bytes and publishes a progress snapshot on a fixed tick.
// Publishing never blocks: a full queue drops the snapshot.
class ProgressTracker {
public:
    ProgressTracker(boost::asio::any_io_executor executor,
                    std::string upload_id,
                    std::uint64_t total_bytes,
                    EventQueue<UploadProgress>* sink,
                    std::chrono::milliseconds interval = transfer::kProgressInterval);

    void Add(std::uint64_t bytes, const std::string& current_file);
    // Bytes the receiver already had; not counted as throughput
    void AddResumed(std::uint64_t bytes);
    void SetUploadId(std::string upload_id);
    void SetStatus(UploadStatus status, std::string error = {});

    UploadProgress Snapshot() const;

    // Ticker; returns after Stop()
    boost::asio::awaitable<void> Run();

    // Ends the ticker and publishes one final snapshot
    void Stop();

private:
    void publish();

    boost::asio::steady_timer timer_;
    std::chrono::milliseconds interval_;
    EventQueue<UploadProgress>* sink_;
    SpeedCalculator speed_;
    std::atomic<bool> stopped_{false};

    mutable std::mutex mutex_;
    UploadProgress progress_;
};

} // namespace deckhand::core
