#include <core/security/random.h>
#include <cstdint>
#include <openssl/rand.h>
#include <stdexcept>
#include <vector>

namespace deckhand::core {

namespace random {

namespace {

std::vector<std::uint8_t> randomBytes(std::size_t count) {
    std::vector<std::uint8_t> bytes(count);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return bytes;
}

} // namespace

std::string NumericCode(std::size_t length) {
    std::string code;
    code.reserve(length);
    while (code.size() < length) {
        for (auto byte : randomBytes(length)) {
            // reject the top of the range to keep digits uniform
            if (byte >= 250) {
                continue;
            }
            code.push_back(static_cast<char>('0' + byte % 10));
            if (code.size() == length) {
                break;
            }
        }
    }
    return code;
}

std::string Token(std::size_t bytes) {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    auto data = randomBytes(bytes);

    std::string out;
    out.reserve((bytes * 4 + 2) / 3);
    std::size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        std::uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out.push_back(kAlphabet[(n >> 18) & 0x3f]);
        out.push_back(kAlphabet[(n >> 12) & 0x3f]);
        out.push_back(kAlphabet[(n >> 6) & 0x3f]);
        out.push_back(kAlphabet[n & 0x3f]);
    }
    if (data.size() - i == 1) {
        std::uint32_t n = data[i] << 16;
        out.push_back(kAlphabet[(n >> 18) & 0x3f]);
        out.push_back(kAlphabet[(n >> 12) & 0x3f]);
    } else if (data.size() - i == 2) {
        std::uint32_t n = (data[i] << 16) | (data[i + 1] << 8);
        out.push_back(kAlphabet[(n >> 18) & 0x3f]);
        out.push_back(kAlphabet[(n >> 12) & 0x3f]);
        out.push_back(kAlphabet[(n >> 6) & 0x3f]);
    }
    return out;
}

} // namespace random

} // namespace deckhand::core
