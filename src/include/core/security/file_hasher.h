#pragma once

#include <cstdint>
#include <filesystem>
#include <openssl/evp.h>
#include <span>
#include <string>

namespace deckhand::core {

// SHA-256 digests rendered as lowercase hex
class FileHasher {
public:
    static std::string CalculateFileChecksum(const std::filesystem::path& file_path);
    static std::string CalculateDataChecksum(std::span<const std::uint8_t> data);
};

// Incremental SHA-256 for data that arrives in pieces
class Sha256 {
public:
    Sha256();
    ~Sha256();
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void Update(std::span<const std::uint8_t> data);
    std::string HexDigest();

private:
    EVP_MD_CTX* ctx_;
};

} // namespace deckhand::core
