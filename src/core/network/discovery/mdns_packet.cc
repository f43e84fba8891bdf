#include <boost/asio/ip/address_v4.hpp>
#include <cctype>
#include <core/network/discovery/mdns_packet.h>
#include <core/protocol/message.h>
#include <format>

namespace deckhand::core {

namespace mdns {

namespace {

constexpr std::size_t kHeaderSize = 12;
constexpr std::size_t kMaxLabel = 63;
constexpr int kMaxPointerHops = 16;

class Writer {
public:
    void U8(std::uint8_t v) { out_.push_back(v); }

    void U16(std::uint16_t v) {
        out_.push_back(static_cast<std::uint8_t>(v >> 8));
        out_.push_back(static_cast<std::uint8_t>(v & 0xff));
    }

    void U32(std::uint32_t v) {
        U16(static_cast<std::uint16_t>(v >> 16));
        U16(static_cast<std::uint16_t>(v & 0xffff));
    }

    void Bytes(std::string_view s) { out_.insert(out_.end(), s.begin(), s.end()); }

    void Name(std::string_view name) {
        if (!name.empty() && name.back() == '.') {
            name.remove_suffix(1);
        }
        while (!name.empty()) {
            auto dot = name.find('.');
            auto label = name.substr(0, dot);
            if (label.empty() || label.size() > kMaxLabel) {
                throw ProtocolError(std::format("invalid dns label in '{}'", name));
            }
            U8(static_cast<std::uint8_t>(label.size()));
            Bytes(label);
            if (dot == std::string_view::npos) {
                break;
            }
            name.remove_prefix(dot + 1);
        }
        U8(0);
    }

    std::size_t size() const { return out_.size(); }

    void Patch16(std::size_t at, std::uint16_t v) {
        out_[at] = static_cast<std::uint8_t>(v >> 8);
        out_[at + 1] = static_cast<std::uint8_t>(v & 0xff);
    }

    std::vector<std::uint8_t> Take() { return std::move(out_); }

private:
    std::vector<std::uint8_t> out_;
};

class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> data)
        : data_(data) {}

    std::uint8_t U8() {
        need(1);
        return data_[pos_++];
    }

    std::uint16_t U16() {
        need(2);
        std::uint16_t v = static_cast<std::uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return v;
    }

    std::uint32_t U32() {
        std::uint32_t hi = U16();
        return (hi << 16) | U16();
    }

    std::string Name() {
        std::string name;
        std::size_t pos = pos_;
        bool jumped = false;
        int hops = 0;
        while (true) {
            if (pos >= data_.size()) {
                throw ProtocolError("dns name runs past end of packet");
            }
            std::uint8_t len = data_[pos];
            if ((len & 0xc0) == 0xc0) {
                if (pos + 1 >= data_.size()) {
                    throw ProtocolError("truncated dns compression pointer");
                }
                if (++hops > kMaxPointerHops) {
                    throw ProtocolError("dns compression loop");
                }
                std::size_t target = static_cast<std::size_t>((len & 0x3f) << 8) | data_[pos + 1];
                if (!jumped) {
                    pos_ = pos + 2;
                    jumped = true;
                }
                pos = target;
                continue;
            }
            if (len > kMaxLabel) {
                throw ProtocolError(std::format("invalid dns label length {}", len));
            }
            ++pos;
            if (len == 0) {
                break;
            }
            if (pos + len > data_.size()) {
                throw ProtocolError("dns label runs past end of packet");
            }
            if (!name.empty()) {
                name.push_back('.');
            }
            name.append(reinterpret_cast<const char*>(data_.data() + pos), len);
            pos += len;
        }
        if (!jumped) {
            pos_ = pos;
        }
        return name;
    }

    std::size_t pos() const { return pos_; }
    void Seek(std::size_t pos) { pos_ = pos; }

    void need(std::size_t n) const {
        if (pos_ + n > data_.size()) {
            throw ProtocolError(std::format("dns packet truncated at offset {}", pos_));
        }
    }

    std::span<const std::uint8_t> data() const { return data_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_{0};
};

void writeRecord(Writer& w, const ResourceRecord& rr) {
    w.Name(rr.name);
    w.U16(rr.type);
    w.U16(rr.klass);
    w.U32(rr.ttl);
    auto length_at = w.size();
    w.U16(0);
    auto start = w.size();
    switch (rr.type) {
    case kA: {
        auto bytes = boost::asio::ip::make_address_v4(rr.address).to_bytes();
        for (auto b : bytes) {
            w.U8(b);
        }
        break;
    }
    case kPtr:
        w.Name(rr.target);
        break;
    case kSrv:
        w.U16(rr.priority);
        w.U16(rr.weight);
        w.U16(rr.port);
        w.Name(rr.target);
        break;
    case kTxt:
        if (rr.text.empty()) {
            w.U8(0);
        }
        for (const auto& s : rr.text) {
            if (s.size() > 255) {
                throw ProtocolError("txt string longer than 255 bytes");
            }
            w.U8(static_cast<std::uint8_t>(s.size()));
            w.Bytes(s);
        }
        break;
    default:
        throw ProtocolError(std::format("cannot encode dns record type {}", rr.type));
    }
    w.Patch16(length_at, static_cast<std::uint16_t>(w.size() - start));
}

ResourceRecord readRecord(Reader& r) {
    ResourceRecord rr;
    rr.name = r.Name();
    rr.type = r.U16();
    rr.klass = r.U16();
    rr.ttl = r.U32();
    std::uint16_t length = r.U16();
    r.need(length);
    std::size_t end = r.pos() + length;

    switch (rr.type) {
    case kA: {
        if (length != 4) {
            throw ProtocolError("A record with bad length");
        }
        boost::asio::ip::address_v4::bytes_type bytes{r.U8(), r.U8(), r.U8(), r.U8()};
        rr.address = boost::asio::ip::address_v4(bytes).to_string();
        break;
    }
    case kPtr:
        rr.target = r.Name();
        break;
    case kSrv:
        rr.priority = r.U16();
        rr.weight = r.U16();
        rr.port = r.U16();
        rr.target = r.Name();
        break;
    case kTxt:
        while (r.pos() < end) {
            std::uint8_t len = r.U8();
            if (r.pos() + len > end) {
                throw ProtocolError("txt string runs past record");
            }
            std::string s;
            for (std::uint8_t i = 0; i < len; ++i) {
                s.push_back(static_cast<char>(r.U8()));
            }
            if (!s.empty()) {
                rr.text.push_back(std::move(s));
            }
        }
        break;
    default:
        break;
    }
    r.Seek(end);
    return rr;
}

} // namespace

std::vector<std::uint8_t> Encode(const Packet& packet) {
    Writer w;
    w.U16(packet.id);
    w.U16(packet.flags);
    w.U16(static_cast<std::uint16_t>(packet.questions.size()));
    w.U16(static_cast<std::uint16_t>(packet.answers.size()));
    w.U16(0);
    w.U16(static_cast<std::uint16_t>(packet.additionals.size()));
    for (const auto& q : packet.questions) {
        w.Name(q.name);
        w.U16(q.type);
        w.U16(q.klass);
    }
    for (const auto& rr : packet.answers) {
        writeRecord(w, rr);
    }
    for (const auto& rr : packet.additionals) {
        writeRecord(w, rr);
    }
    return w.Take();
}

Packet Decode(std::span<const std::uint8_t> data) {
    if (data.size() < kHeaderSize) {
        throw ProtocolError("dns packet shorter than header");
    }
    Reader r(data);
    Packet packet;
    packet.id = r.U16();
    packet.flags = r.U16();
    std::uint16_t qd = r.U16();
    std::uint16_t an = r.U16();
    std::uint16_t ns = r.U16();
    std::uint16_t ar = r.U16();

    for (std::uint16_t i = 0; i < qd; ++i) {
        Question q;
        q.name = r.Name();
        q.type = r.U16();
        q.klass = r.U16();
        packet.questions.push_back(std::move(q));
    }
    for (std::uint16_t i = 0; i < an; ++i) {
        packet.answers.push_back(readRecord(r));
    }
    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(ns) + ar; ++i) {
        packet.additionals.push_back(readRecord(r));
    }
    return packet;
}

bool NameEquals(std::string_view a, std::string_view b) {
    if (!a.empty() && a.back() == '.') {
        a.remove_suffix(1);
    }
    if (!b.empty() && b.back() == '.') {
        b.remove_suffix(1);
    }
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i]))
            != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace mdns

} // namespace deckhand::core
