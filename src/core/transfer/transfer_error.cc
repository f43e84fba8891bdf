#include <core/transfer/transfer_error.h>

namespace deckhand::core {

TransferError::TransferError(TransferErrorKind kind,
                             const std::string& message,
                             std::string file,
                             std::uint64_t offset)
    : std::runtime_error(message)
    , kind_(kind)
    , file_(std::move(file))
    , offset_(offset) {}

} // namespace deckhand::core
