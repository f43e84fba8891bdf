#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace deckhand::core {

constexpr std::string_view kAppVersion = "0.1.0";

namespace protocol {

constexpr std::string_view kProtocolVersion = "1";

constexpr std::chrono::seconds kWriteWait{30};
constexpr std::chrono::seconds kPingInterval{10};
// must stay below kPingInterval
constexpr std::chrono::seconds kPongDeadline{5};
constexpr std::chrono::seconds kRequestTimeout{30};
constexpr std::chrono::seconds kConnectTimeout{30};

constexpr std::size_t kMaxMessageSize = 50 * 1024 * 1024; // 50 MB

constexpr std::string_view kWebsocketPath = "/ws";

static_assert(kPongDeadline < kPingInterval);

} // namespace protocol

namespace discovery {

constexpr std::string_view kServiceType = "_deckhand._tcp";
constexpr std::string_view kDomain = "local";
constexpr std::uint16_t kDefaultPort = 8765;
constexpr std::uint32_t kDefaultTtl = 120; // seconds

constexpr std::string_view kMulticastAddress = "224.0.0.251";
constexpr std::uint16_t kMulticastPort = 5353;

constexpr std::chrono::seconds kStaleTimeout{120};
constexpr std::chrono::seconds kBrowseTimeout{3};
constexpr std::chrono::seconds kBrowseInterval{30};

constexpr std::size_t kEventQueueCapacity = 16;

} // namespace discovery

namespace pairing {

constexpr std::size_t kCodeLength = 6;
constexpr std::chrono::seconds kCodeExpiry{60};
constexpr std::size_t kTokenBytes = 32;
constexpr int kMaxFailedAttempts = 3;
constexpr std::chrono::minutes kLockoutDuration{5};

} // namespace pairing

} // namespace deckhand::core
