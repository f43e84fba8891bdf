#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <vector>

namespace deckhand {

using BinaryData = std::vector<std::uint8_t>;
using BinaryMessage = std::vector<std::uint8_t>;

// Frame layout: [4 bytes big-endian header length][JSON header][payload bytes]
struct ParsedBinaryMessage {
    nlohmann::json header;
    BinaryData data;
};

BinaryMessage CreateBinaryMessage(const nlohmann::json& header, std::span<const std::uint8_t> data);

// std::nullopt on a truncated frame or an unparsable header
std::optional<ParsedBinaryMessage> ParseBinaryMessage(std::span<const std::uint8_t> message);

} // namespace deckhand
