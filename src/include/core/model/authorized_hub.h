#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace deckhand::core {

// A Hub that completed pairing with this Agent. Timestamps are unix seconds.
struct AuthorizedHub {
    std::string hub_id;
    std::string name;
    std::string platform;
    std::string token;
    std::int64_t paired_at = 0;
    std::int64_t last_seen = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(
        AuthorizedHub, hub_id, name, platform, token, paired_at, last_seen)
};

} // namespace deckhand::core
