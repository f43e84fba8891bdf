#pragma once

#include <chrono>
#include <cstddef>

namespace deckhand::core {

namespace transfer {

constexpr size_t kDefaultChunkSize = 1 * 1024 * 1024; // 1 MB
constexpr size_t kMaxChunkSize = 32 * 1024 * 1024;    // 32 MB

constexpr std::chrono::milliseconds kProgressInterval{500};

// throughput estimator window
constexpr std::chrono::seconds kSpeedWindow{5};
constexpr size_t kSpeedMaxSamples = 100;

// a chunk rejected for a checksum mismatch is resent at most this many times
constexpr int kMaxChunkRetries = 3;

} // namespace transfer

} // namespace deckhand::core
