#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace deckhand::core {

namespace mdns {

enum RecordType : std::uint16_t {
    kA = 1,
    kPtr = 12,
    kTxt = 16,
    kSrv = 33,
    kAny = 255,
};

constexpr std::uint16_t kClassIn = 1;
constexpr std::uint16_t kCacheFlush = 0x8000;
constexpr std::uint16_t kFlagResponse = 0x8000;
constexpr std::uint16_t kFlagAuthoritative = 0x0400;

struct Question {
    std::string name;
    std::uint16_t type = kPtr;
    std::uint16_t klass = kClassIn;
};

// One resource record with its rdata already decoded for the types we use.
// Fields not relevant to `type` stay empty.
struct ResourceRecord {
    std::string name;
    std::uint16_t type = kA;
    std::uint16_t klass = kClassIn;
    std::uint32_t ttl = 0;

    std::string target;             // PTR domain name, SRV target host
    std::uint16_t priority = 0;     // SRV
    std::uint16_t weight = 0;       // SRV
    std::uint16_t port = 0;         // SRV
    std::vector<std::string> text;  // TXT strings
    std::string address;            // A, dotted quad
};

struct Packet {
    std::uint16_t id = 0;
    std::uint16_t flags = 0;
    std::vector<Question> questions;
    std::vector<ResourceRecord> answers;
    // authority and additional sections are folded together
    std::vector<ResourceRecord> additionals;

    bool IsResponse() const { return (flags & kFlagResponse) != 0; }
};

// Names are written uncompressed
std::vector<std::uint8_t> Encode(const Packet& packet);

// Follows compression pointers; throws ProtocolError on anything truncated or
// looping
Packet Decode(std::span<const std::uint8_t> data);

// Case-insensitive, trailing dot ignored
bool NameEquals(std::string_view a, std::string_view b);

} // namespace mdns

} // namespace deckhand::core
