#include <cstring>
#include <core/util/binary_message.h>
#include <spdlog/spdlog.h>

namespace deckhand {

namespace {

constexpr std::size_t kHeaderLengthSize = 4;

} // namespace

BinaryMessage CreateBinaryMessage(const nlohmann::json& header, std::span<const std::uint8_t> data) {
    std::string header_str = header.dump();
    auto header_size = static_cast<std::uint32_t>(header_str.size());

    BinaryMessage message;
    message.reserve(kHeaderLengthSize + header_str.size() + data.size());
    message.push_back(static_cast<std::uint8_t>(header_size >> 24));
    message.push_back(static_cast<std::uint8_t>(header_size >> 16));
    message.push_back(static_cast<std::uint8_t>(header_size >> 8));
    message.push_back(static_cast<std::uint8_t>(header_size));
    message.insert(message.end(), header_str.begin(), header_str.end());
    message.insert(message.end(), data.begin(), data.end());
    return message;
}

std::optional<ParsedBinaryMessage> ParseBinaryMessage(std::span<const std::uint8_t> message) {
    if (message.size() < kHeaderLengthSize) {
        return std::nullopt;
    }

    std::uint32_t header_size = (static_cast<std::uint32_t>(message[0]) << 24)
                                | (static_cast<std::uint32_t>(message[1]) << 16)
                                | (static_cast<std::uint32_t>(message[2]) << 8)
                                | static_cast<std::uint32_t>(message[3]);

    if (message.size() - kHeaderLengthSize < header_size) {
        return std::nullopt;
    }

    ParsedBinaryMessage parsed;
    std::string header_str(reinterpret_cast<const char*>(message.data() + kHeaderLengthSize),
                           header_size);
    try {
        parsed.header = nlohmann::json::parse(header_str);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse binary header JSON: {}", e.what());
        return std::nullopt;
    }

    auto payload = message.subspan(kHeaderLengthSize + header_size);
    parsed.data.assign(payload.begin(), payload.end());
    return parsed;
}

} // namespace deckhand
