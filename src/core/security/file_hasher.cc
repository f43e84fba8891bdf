#include <core/security/file_hasher.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace deckhand::core {

namespace {

std::string toHex(const unsigned char* hash, unsigned int hash_len) {
    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace

Sha256::Sha256()
    : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ == nullptr || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::Update(std::span<const std::uint8_t> data) {
    if (!data.empty() && EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256::HexDigest() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &hash_len) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }
    return toHex(hash, hash_len);
}

std::string FileHasher::CalculateFileChecksum(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file for checksum calculation: "
                                 + file_path.string());
    }

    Sha256 hasher;
    constexpr size_t buffer_size = 64 * 1024;
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        auto bytes_read = static_cast<size_t>(file.gcount());
        if (bytes_read > 0) {
            hasher.Update(std::span(buffer.data(), bytes_read));
        }
    }

    return hasher.HexDigest();
}

std::string FileHasher::CalculateDataChecksum(std::span<const std::uint8_t> data) {
    Sha256 hasher;
    hasher.Update(data);
    return hasher.HexDigest();
}

} // namespace deckhand::core
