#pragma once

#include <cstdlib>
#include <filesystem>

namespace deckhand::core {
namespace path {

namespace details {

inline std::filesystem::path HomeDir() {
    const char* home = std::getenv("HOME");
    return home ? std::filesystem::path(home) : std::filesystem::temp_directory_path();
}

} // namespace details

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "Deckhand"
                                             / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(__APPLE__)
    details::HomeDir() / "Library" / "Application Support" / "Deckhand";
#else
    details::HomeDir() / ".config" / "Deckhand";
#endif

// Agent and Hub keep their persisted state apart so both can run on one machine
inline const std::filesystem::path kAgentDataDir = kConfigDir / "agent";
inline const std::filesystem::path kHubDataDir = kConfigDir / "hub";

inline const std::filesystem::path kDefaultInstallDir = details::HomeDir() / "Games";

} // namespace path
} // namespace deckhand::core
