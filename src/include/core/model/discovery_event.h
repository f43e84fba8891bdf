#pragma once

#include "agent_info.h"
#include <nlohmann/json.hpp>

namespace deckhand::core {

enum class DiscoveryEventType {
    kDiscovered, // first sighting of an agent
    kUpdated,    // re-announce, last_seen / address refreshed
    kLost,       // pruned after the stale timeout
};

NLOHMANN_JSON_SERIALIZE_ENUM(DiscoveryEventType,
                             {
                                 {DiscoveryEventType::kDiscovered, "discovered"},
                                 {DiscoveryEventType::kUpdated, "updated"},
                                 {DiscoveryEventType::kLost, "lost"},
                             });

struct DiscoveryEvent {
    DiscoveryEventType type;
    DiscoveredAgent agent;
};

} // namespace deckhand::core
