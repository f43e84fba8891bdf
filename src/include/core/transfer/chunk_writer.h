#pragma once

#include <core/transfer/chunk.h>
#include <cstdint>
#include <filesystem>
#include <string_view>

namespace deckhand::core {

// Joins a relative upload path onto root. Throws TransferError(kInvalidPath) for
// absolute paths and paths that would leave root.
std::filesystem::path ResolveUploadPath(const std::filesystem::path& root,
                                        std::string_view relative_path);

// Writes chunks at their declared offsets below a root directory. The checksum is
// verified before anything touches the disk, so a corrupt chunk never lands.
class ChunkWriter {
public:
    explicit ChunkWriter(std::filesystem::path root);

    void WriteChunk(const Chunk& chunk) const;

    // Bytes already on disk for a file, 0 when it does not exist
    std::uint64_t ExistingSize(std::string_view relative_path) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

} // namespace deckhand::core
