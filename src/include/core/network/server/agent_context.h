#pragma once

#include <atomic>
#include <core/auth/pairing_manager.h>
#include <core/model/agent_info.h>
#include <core/steam/steam_paths.h>
#include <core/transfer/upload_manager.h>
#include <mutex>
#include <optional>

namespace deckhand::core {

// Process-wide agent state shared by every hub session
struct AgentContext {
    AgentInfo info;
    UploadManager& uploads;
    PairingManager& pairing;
    std::optional<SteamPaths> steam;
    // serializes writes to the shortcuts database and grid directory
    std::mutex library_mutex;
};

} // namespace deckhand::core
