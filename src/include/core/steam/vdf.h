#pragma once

#include <core/model/shortcut.h>
#include <core/util/binary_message.h>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace deckhand::core {

class VdfError : public std::runtime_error {
public:
    VdfError(const std::string& message, std::size_t offset);

    // byte offset in the input where decoding stopped
    std::size_t offset() const { return offset_; }

private:
    std::size_t offset_;
};

namespace vdf {

constexpr std::uint8_t kTypeObject = 0x00;
constexpr std::uint8_t kTypeString = 0x01;
constexpr std::uint8_t kTypeInt32 = 0x02;
constexpr std::uint8_t kTypeFloat32 = 0x03;
constexpr std::uint8_t kTypeUint64 = 0x07;
constexpr std::uint8_t kTypeEnd = 0x08;
constexpr std::uint8_t kTypeInt64 = 0x0a;

constexpr std::string_view kRootKey = "shortcuts";

// Cursor over a binary VDF buffer. Every read checks bounds first and throws
// VdfError instead of reading past the end.
class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> data)
        : data_(data) {}

    std::uint8_t ReadByte();
    std::string ReadString();
    std::uint32_t ReadUint32();

    // Consumes a value of the given type and returns its encoded bytes
    std::span<const std::uint8_t> SkipValue(std::uint8_t type);

    std::size_t position() const { return pos_; }
    bool AtEnd() const { return pos_ >= data_.size(); }

private:
    void require(std::size_t count, const char* what) const;
    void skipObject();

    std::span<const std::uint8_t> data_;
    std::size_t pos_{0};
};

std::vector<ShortcutEntry> ParseShortcuts(std::span<const std::uint8_t> data);

// Tags are always rewritten with sequential keys "0", "1", ...
BinaryData WriteShortcuts(const std::vector<ShortcutEntry>& entries);

} // namespace vdf

} // namespace deckhand::core
