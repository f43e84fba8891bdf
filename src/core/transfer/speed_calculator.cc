#include <core/transfer/speed_calculator.h>
#include <iterator>

namespace deckhand::core {

SpeedCalculator::SpeedCalculator(std::chrono::milliseconds window, std::size_t max_samples)
    : window_(window)
    , max_samples_(max_samples < 2 ? 2 : max_samples) {}

void SpeedCalculator::AddBytes(std::uint64_t bytes, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back(Sample{now, bytes});
    while (!samples_.empty() && now - samples_.front().at > window_) {
        samples_.pop_front();
    }
    while (samples_.size() > max_samples_) {
        samples_.pop_front();
    }
}

double SpeedCalculator::BytesPerSecond() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.size() < 2) {
        return 0.0;
    }
    auto span = std::chrono::duration<double>(samples_.back().at - samples_.front().at).count();
    if (span <= 0.0) {
        return 0.0;
    }
    // the first sample only marks where the span starts
    std::uint64_t bytes = 0;
    for (auto it = std::next(samples_.begin()); it != samples_.end(); ++it) {
        bytes += it->bytes;
    }
    return static_cast<double>(bytes) / span;
}

double SpeedCalculator::EtaSeconds(std::uint64_t remaining) const {
    auto speed = BytesPerSecond();
    if (speed <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(remaining) / speed;
}

std::size_t SpeedCalculator::sample_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

void SpeedCalculator::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
}

} // namespace deckhand::core
