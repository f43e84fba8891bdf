#pragma once

#include <core/model/upload.h>
#include <core/transfer/chunk.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>

namespace deckhand::core {

// Every regular file below a directory, sorted by relative path
struct Manifest {
    std::vector<FileEntry> files;
    std::uint64_t total_size = 0;
};

Manifest BuildManifest(const std::filesystem::path& root);

// Splits one file into checksummed chunks, starting at a resume offset.
// An empty file yields a single empty chunk so that the receiver creates it.
class ChunkReader {
public:
    ChunkReader(const std::filesystem::path& root,
                std::string relative_path,
                std::uint64_t chunk_size,
                std::uint64_t start_offset = 0);

    std::optional<Chunk> Next();

    std::uint64_t file_size() const { return file_size_; }

private:
    std::string relative_path_;
    std::ifstream file_;
    std::uint64_t chunk_size_;
    std::uint64_t offset_;
    std::uint64_t file_size_;
    bool emitted_empty_{false};
};

} // namespace deckhand::core
