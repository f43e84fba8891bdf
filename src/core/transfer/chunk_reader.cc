#include <algorithm>
#include <core/security/file_hasher.h>
#include <core/transfer/chunk_reader.h>
#include <core/transfer/chunk_writer.h>
#include <core/transfer/transfer_error.h>

namespace deckhand::core {

Manifest BuildManifest(const std::filesystem::path& root) {
    if (!std::filesystem::is_directory(root)) {
        throw TransferError(TransferErrorKind::kNotFound,
                            "source is not a directory: " + root.string());
    }

    Manifest manifest;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        FileEntry file;
        file.relative_path = std::filesystem::relative(entry.path(), root).generic_string();
        file.size = entry.file_size();
        manifest.total_size += file.size;
        manifest.files.push_back(std::move(file));
    }
    std::sort(manifest.files.begin(), manifest.files.end(), [](const auto& a, const auto& b) {
        return a.relative_path < b.relative_path;
    });
    return manifest;
}

ChunkReader::ChunkReader(const std::filesystem::path& root,
                         std::string relative_path,
                         std::uint64_t chunk_size,
                         std::uint64_t start_offset)
    : relative_path_(std::move(relative_path))
    , chunk_size_(chunk_size)
    , offset_(start_offset) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    auto path = ResolveUploadPath(root, relative_path_);
    file_.open(path, std::ios::binary);
    if (!file_) {
        throw TransferError(TransferErrorKind::kIo, "failed to open file", relative_path_);
    }
    file_size_ = std::filesystem::file_size(path);
    if (offset_ > file_size_) {
        offset_ = file_size_;
    }
    // a resumed empty or complete file has nothing left to send
    emitted_empty_ = file_size_ != 0 || start_offset != 0;
    file_.seekg(static_cast<std::streamoff>(offset_));
}

std::optional<Chunk> ChunkReader::Next() {
    if (file_size_ == 0) {
        if (emitted_empty_) {
            return std::nullopt;
        }
        emitted_empty_ = true;
        Chunk chunk;
        chunk.file_path = relative_path_;
        chunk.offset = 0;
        chunk.checksum = FileHasher::CalculateDataChecksum(chunk.data);
        return chunk;
    }
    if (offset_ >= file_size_) {
        return std::nullopt;
    }

    auto size = std::min(chunk_size_, file_size_ - offset_);
    Chunk chunk;
    chunk.file_path = relative_path_;
    chunk.offset = offset_;
    chunk.data.resize(size);
    file_.read(reinterpret_cast<char*>(chunk.data.data()), static_cast<std::streamsize>(size));
    if (static_cast<std::uint64_t>(file_.gcount()) != size) {
        throw TransferError(TransferErrorKind::kIo, "short read", relative_path_, offset_);
    }
    chunk.checksum = FileHasher::CalculateDataChecksum(chunk.data);
    offset_ += size;
    return chunk;
}

} // namespace deckhand::core
