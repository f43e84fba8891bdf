#include <core/security/file_hasher.h>
#include <core/transfer/chunk_writer.h>
#include <core/transfer/transfer_error.h>
#include <fstream>

namespace deckhand::core {

std::filesystem::path ResolveUploadPath(const std::filesystem::path& root,
                                        std::string_view relative_path) {
    if (relative_path.empty()) {
        throw TransferError(TransferErrorKind::kInvalidPath, "empty file path");
    }
    std::filesystem::path relative(relative_path);
    if (relative.is_absolute() || relative.has_root_name() || relative_path.front() == '/') {
        throw TransferError(TransferErrorKind::kInvalidPath,
                            "absolute file path not allowed",
                            std::string(relative_path));
    }
    for (const auto& part : relative) {
        if (part == "..") {
            throw TransferError(TransferErrorKind::kInvalidPath,
                                "file path escapes the upload directory",
                                std::string(relative_path));
        }
    }
    return (root / relative).lexically_normal();
}

ChunkWriter::ChunkWriter(std::filesystem::path root)
    : root_(std::move(root)) {}

void ChunkWriter::WriteChunk(const Chunk& chunk) const {
    auto target = ResolveUploadPath(root_, chunk.file_path);

    if (!chunk.checksum.empty()) {
        auto actual = FileHasher::CalculateDataChecksum(chunk.data);
        if (actual != chunk.checksum) {
            throw TransferError(TransferErrorKind::kChecksumMismatch,
                                "checksum mismatch: expected " + chunk.checksum + ", got "
                                    + actual,
                                chunk.file_path,
                                chunk.offset);
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw TransferError(TransferErrorKind::kIo,
                            "failed to create directory: " + ec.message(),
                            chunk.file_path,
                            chunk.offset);
    }

    if (!std::filesystem::exists(target)) {
        std::ofstream create(target, std::ios::binary);
        if (!create) {
            throw TransferError(TransferErrorKind::kIo,
                                "failed to create file",
                                chunk.file_path,
                                chunk.offset);
        }
    }

    std::fstream file(target, std::ios::binary | std::ios::in | std::ios::out);
    if (!file) {
        throw TransferError(TransferErrorKind::kIo,
                            "failed to open file",
                            chunk.file_path,
                            chunk.offset);
    }
    file.seekp(static_cast<std::streamoff>(chunk.offset));
    file.write(reinterpret_cast<const char*>(chunk.data.data()),
               static_cast<std::streamsize>(chunk.data.size()));
    file.flush();
    if (!file) {
        throw TransferError(TransferErrorKind::kIo,
                            "failed to write chunk",
                            chunk.file_path,
                            chunk.offset);
    }
}

std::uint64_t ChunkWriter::ExistingSize(std::string_view relative_path) const {
    auto target = ResolveUploadPath(root_, relative_path);
    std::error_code ec;
    auto size = std::filesystem::file_size(target, ec);
    return ec ? 0 : size;
}

} // namespace deckhand::core
