#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace deckhand::core {

enum class TransferErrorKind {
    kIo,
    kChecksumMismatch,
    kInvalidPath,
    kNotFound,   // no such upload session
    kNotActive,  // session already terminal
    kOverflow,   // chunk reaches past the declared file size
    kIncomplete, // completion requested before every byte arrived
    kBadManifest,
};

NLOHMANN_JSON_SERIALIZE_ENUM(TransferErrorKind,
                             {
                                 {TransferErrorKind::kIo, "io"},
                                 {TransferErrorKind::kChecksumMismatch, "checksum_mismatch"},
                                 {TransferErrorKind::kInvalidPath, "invalid_path"},
                                 {TransferErrorKind::kNotFound, "not_found"},
                                 {TransferErrorKind::kNotActive, "not_active"},
                                 {TransferErrorKind::kOverflow, "overflow"},
                                 {TransferErrorKind::kIncomplete, "incomplete"},
                                 {TransferErrorKind::kBadManifest, "bad_manifest"},
                             });

class TransferError : public std::runtime_error {
public:
    TransferError(TransferErrorKind kind,
                  const std::string& message,
                  std::string file = {},
                  std::uint64_t offset = 0);

    TransferErrorKind kind() const { return kind_; }
    const std::string& file() const { return file_; }
    std::uint64_t offset() const { return offset_; }

private:
    TransferErrorKind kind_;
    std::string file_;
    std::uint64_t offset_;
};

} // namespace deckhand::core
