#include <core/network/client/capabilities.h>
#include <format>

namespace deckhand::core {

RemoteError::RemoteError(int code, const std::string& message)
    : std::runtime_error(std::format("{} ({})", message, code))
    , code_(code) {}

} // namespace deckhand::core
