#include <algorithm>
#include <cctype>
#include <core/steam/vdf.h>
#include <format>

namespace deckhand::core {

VdfError::VdfError(const std::string& message, std::size_t offset)
    : std::runtime_error(std::format("{} (at byte {})", message, offset))
    , offset_(offset) {}

namespace vdf {

namespace {

bool keyEquals(std::string_view key, std::string_view expected) {
    return std::equal(key.begin(),
                      key.end(),
                      expected.begin(),
                      expected.end(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a))
                                 == std::tolower(static_cast<unsigned char>(b));
                      });
}

std::vector<std::string> parseTags(Reader& reader) {
    std::vector<std::string> tags;
    while (true) {
        std::uint8_t type = reader.ReadByte();
        if (type == kTypeEnd) {
            return tags;
        }
        reader.ReadString(); // positional key, order of appearance wins
        if (type == kTypeString) {
            tags.push_back(reader.ReadString());
        } else {
            reader.SkipValue(type);
        }
    }
}

ShortcutEntry parseEntry(Reader& reader) {
    ShortcutEntry entry;
    while (true) {
        std::size_t field_offset = reader.position();
        std::uint8_t type = reader.ReadByte();
        if (type == kTypeEnd) {
            return entry;
        }
        std::string key = reader.ReadString();

        if (type == kTypeString) {
            if (keyEquals(key, "AppName")) {
                entry.name = reader.ReadString();
                continue;
            }
            if (keyEquals(key, "Exe")) {
                entry.exe = reader.ReadString();
                continue;
            }
            if (keyEquals(key, "StartDir")) {
                entry.start_dir = reader.ReadString();
                continue;
            }
            if (keyEquals(key, "LaunchOptions")) {
                entry.launch_options = reader.ReadString();
                continue;
            }
        } else if (type == kTypeInt32) {
            if (keyEquals(key, "appid")) {
                entry.app_id = reader.ReadUint32();
                continue;
            }
            if (keyEquals(key, "LastPlayTime")) {
                entry.last_played = reader.ReadUint32();
                continue;
            }
        } else if (type == kTypeObject && keyEquals(key, "tags")) {
            entry.tags = parseTags(reader);
            continue;
        }

        try {
            auto raw = reader.SkipValue(type);
            entry.extra_fields.push_back(
                RawVdfField{type, std::move(key), std::vector<std::uint8_t>(raw.begin(), raw.end())});
        } catch (const VdfError& e) {
            throw VdfError(std::format("bad field \"{}\": {}", key, e.what()), field_offset);
        }
    }
}

void putString(BinaryData& out, std::string_view value) {
    out.insert(out.end(), value.begin(), value.end());
    out.push_back(0x00);
}

void putUint32(BinaryData& out, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

void putStringField(BinaryData& out, std::string_view key, std::string_view value) {
    out.push_back(kTypeString);
    putString(out, key);
    putString(out, value);
}

void putIntField(BinaryData& out, std::string_view key, std::uint32_t value) {
    out.push_back(kTypeInt32);
    putString(out, key);
    putUint32(out, value);
}

} // namespace

void Reader::require(std::size_t count, const char* what) const {
    if (pos_ > data_.size() || data_.size() - pos_ < count) {
        throw VdfError(std::format("unexpected end of data reading {}", what), pos_);
    }
}

std::uint8_t Reader::ReadByte() {
    require(1, "type marker");
    return data_[pos_++];
}

std::string Reader::ReadString() {
    auto begin = data_.begin() + static_cast<std::ptrdiff_t>(pos_);
    auto terminator = std::find(begin, data_.end(), std::uint8_t{0});
    if (terminator == data_.end()) {
        throw VdfError("unterminated string", pos_);
    }
    std::string value(begin, terminator);
    pos_ += value.size() + 1;
    return value;
}

std::uint32_t Reader::ReadUint32() {
    require(4, "int32");
    std::uint32_t value = static_cast<std::uint32_t>(data_[pos_])
                          | (static_cast<std::uint32_t>(data_[pos_ + 1]) << 8)
                          | (static_cast<std::uint32_t>(data_[pos_ + 2]) << 16)
                          | (static_cast<std::uint32_t>(data_[pos_ + 3]) << 24);
    pos_ += 4;
    return value;
}

void Reader::skipObject() {
    while (true) {
        std::uint8_t type = ReadByte();
        if (type == kTypeEnd) {
            return;
        }
        ReadString();
        SkipValue(type);
    }
}

std::span<const std::uint8_t> Reader::SkipValue(std::uint8_t type) {
    std::size_t start = pos_;
    switch (type) {
    case kTypeObject:
        skipObject();
        break;
    case kTypeString:
        ReadString();
        break;
    case kTypeInt32:
    case kTypeFloat32:
        require(4, "32-bit value");
        pos_ += 4;
        break;
    case kTypeUint64:
    case kTypeInt64:
        require(8, "64-bit value");
        pos_ += 8;
        break;
    default:
        throw VdfError(std::format("unknown type marker 0x{:02x}", type), start - 1);
    }
    return data_.subspan(start, pos_ - start);
}

std::vector<ShortcutEntry> ParseShortcuts(std::span<const std::uint8_t> data) {
    // object marker, root key, terminator and the closing end marker
    constexpr std::size_t kMinimalSize = 1 + kRootKey.size() + 1 + 1;
    if (data.size() < kMinimalSize) {
        throw VdfError(std::format("shortcuts data too small ({} bytes)", data.size()), 0);
    }

    Reader reader(data);
    if (reader.ReadByte() != kTypeObject) {
        throw VdfError("expected object marker at start", 0);
    }
    auto root = reader.ReadString();
    if (!keyEquals(root, kRootKey)) {
        throw VdfError(std::format("expected root key \"shortcuts\", got \"{}\"", root), 1);
    }

    std::vector<ShortcutEntry> entries;
    while (true) {
        std::size_t entry_offset = reader.position();
        std::uint8_t type = reader.ReadByte();
        if (type == kTypeEnd) {
            break;
        }
        if (type != kTypeObject) {
            throw VdfError(std::format("expected shortcut object, got 0x{:02x}", type),
                           entry_offset);
        }
        reader.ReadString(); // index key
        entries.push_back(parseEntry(reader));
    }
    return entries;
}

BinaryData WriteShortcuts(const std::vector<ShortcutEntry>& entries) {
    BinaryData out;
    out.push_back(kTypeObject);
    putString(out, kRootKey);

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        out.push_back(kTypeObject);
        putString(out, std::to_string(i));

        putIntField(out, "appid", entry.app_id);
        putStringField(out, "AppName", entry.name);
        putStringField(out, "Exe", entry.exe);
        putStringField(out, "StartDir", entry.start_dir);
        putStringField(out, "LaunchOptions", entry.launch_options);
        if (entry.last_played) {
            putIntField(out, "LastPlayTime", static_cast<std::uint32_t>(*entry.last_played));
        }
        for (const auto& field : entry.extra_fields) {
            out.push_back(field.type);
            putString(out, field.key);
            out.insert(out.end(), field.value.begin(), field.value.end());
        }

        out.push_back(kTypeObject);
        putString(out, "tags");
        for (std::size_t t = 0; t < entry.tags.size(); ++t) {
            putStringField(out, std::to_string(t), entry.tags[t]);
        }
        out.push_back(kTypeEnd);

        out.push_back(kTypeEnd);
    }

    out.push_back(kTypeEnd);
    out.push_back(kTypeEnd);
    return out;
}

} // namespace vdf

} // namespace deckhand::core
