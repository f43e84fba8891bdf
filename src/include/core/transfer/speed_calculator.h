#pragma once

#include <chrono>
#include <core/constant/transfer.h>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace deckhand::core {

// Throughput over a sliding window of byte-delta samples. The window is bounded in
// time and in sample count, so memory stays flat however long a transfer runs.
class SpeedCalculator {
public:
    using Clock = std::chrono::steady_clock;

    explicit SpeedCalculator(std::chrono::milliseconds window = transfer::kSpeedWindow,
                             std::size_t max_samples = transfer::kSpeedMaxSamples);

    void AddBytes(std::uint64_t bytes, Clock::time_point now = Clock::now());

    // 0 until two samples span a positive interval
    double BytesPerSecond() const;

    // Seconds left for `remaining` bytes; 0 when the speed is 0
    double EtaSeconds(std::uint64_t remaining) const;

    std::size_t sample_count() const;
    void Reset();

private:
    struct Sample {
        Clock::time_point at;
        std::uint64_t bytes;
    };

    const std::chrono::milliseconds window_;
    const std::size_t max_samples_;
    mutable std::mutex mutex_;
    std::deque<Sample> samples_;
};

} // namespace deckhand::core
