#include <array>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cctype>
#include <core/constant/protocol.h>
#include <core/network/discovery/mdns_packet.h>
#include <core/network/discovery/service_browser.h>
#include <core/protocol/message.h>
#include <format>
#include <map>
#include <memory>
#include <set>
#include <spdlog/spdlog.h>

using namespace boost::asio;

namespace deckhand::core {

namespace {

constexpr std::size_t kReceiveBufferSize = 9000;

// Accumulates records across every response received during one browse
class ResponseCollector {
public:
    explicit ResponseCollector(const std::string& service_name)
        : service_name_(service_name) {}

    void Add(const mdns::Packet& packet) {
        auto consume = [this](const mdns::ResourceRecord& rr) {
            switch (rr.type) {
            case mdns::kPtr:
                if (mdns::NameEquals(rr.name, service_name_) && rr.ttl > 0) {
                    instances_.insert(rr.target);
                }
                break;
            case mdns::kSrv:
                srv_[lower(rr.name)] = rr;
                break;
            case mdns::kTxt:
                txt_[lower(rr.name)] = rr.text;
                break;
            case mdns::kA:
                addresses_[lower(rr.name)].insert(rr.address);
                break;
            default:
                break;
            }
        };
        for (const auto& rr : packet.answers) {
            consume(rr);
        }
        for (const auto& rr : packet.additionals) {
            consume(rr);
        }
    }

    std::vector<ServiceEntry> Entries() const {
        std::vector<ServiceEntry> entries;
        for (const auto& full_name : instances_) {
            auto srv = srv_.find(lower(full_name));
            if (srv == srv_.end()) {
                spdlog::debug("mDNS instance {} answered without SRV record", full_name);
                continue;
            }
            ServiceEntry entry;
            entry.instance = instanceLabel(full_name);
            entry.host = srv->second.target;
            entry.port = srv->second.port;
            if (auto txt = txt_.find(lower(full_name)); txt != txt_.end()) {
                entry.text = txt->second;
            }
            if (auto a = addresses_.find(lower(entry.host)); a != addresses_.end()) {
                entry.ipv4.assign(a->second.begin(), a->second.end());
            }
            entries.push_back(std::move(entry));
        }
        return entries;
    }

private:
    static std::string lower(std::string s) {
        for (auto& c : s) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (!s.empty() && s.back() == '.') {
            s.pop_back();
        }
        return s;
    }

    std::string instanceLabel(const std::string& full_name) const {
        auto suffix = "." + service_name_;
        if (full_name.size() > suffix.size()
            && mdns::NameEquals(full_name.substr(full_name.size() - suffix.size()), suffix)) {
            return full_name.substr(0, full_name.size() - suffix.size());
        }
        return full_name;
    }

    const std::string& service_name_;
    std::set<std::string> instances_;
    std::map<std::string, mdns::ResourceRecord> srv_;
    std::map<std::string, std::vector<std::string>> txt_;
    std::map<std::string, std::set<std::string>> addresses_;
};

} // namespace

std::string ServiceName() {
    return std::format("{}.{}", discovery::kServiceType, discovery::kDomain);
}

ip::udp::endpoint MdnsGroup() {
    return ip::udp::endpoint(ip::make_address(discovery::kMulticastAddress), discovery::kMulticastPort);
}

MdnsBrowser::MdnsBrowser(any_io_executor executor, std::string service_name, ip::udp::endpoint query_to)
    : executor_(std::move(executor))
    , service_name_(std::move(service_name))
    , query_to_(std::move(query_to)) {}

awaitable<std::vector<ServiceEntry>> MdnsBrowser::Browse(std::chrono::milliseconds timeout) {
    // shared with the deadline handler, which may run after this frame is gone
    auto socket = std::make_shared<ip::udp::socket>(executor_, ip::udp::endpoint(ip::udp::v4(), 0));
    socket->set_option(ip::multicast::hops(255));

    mdns::Packet query;
    query.questions.push_back({service_name_, mdns::kPtr, mdns::kClassIn});
    auto bytes = mdns::Encode(query);

    co_await socket->async_send_to(buffer(bytes), query_to_, use_awaitable);

    steady_timer deadline(executor_, timeout);
    deadline.async_wait([socket](const boost::system::error_code& ec) {
        if (!ec) {
            boost::system::error_code ignored;
            socket->cancel(ignored);
        }
    });

    ResponseCollector collector(service_name_);
    std::array<std::uint8_t, kReceiveBufferSize> buf;
    // A receive started after the deadline handler ran would never be cancelled
    while (deadline.expiry() > steady_timer::clock_type::now()) {
        ip::udp::endpoint sender;
        boost::system::error_code ec;
        auto n = co_await socket->async_receive_from(buffer(buf),
                                                     sender,
                                                     redirect_error(use_awaitable, ec));
        if (ec == error::operation_aborted) {
            break;
        }
        if (ec) {
            spdlog::warn("mDNS receive failed: {}", ec.message());
            break;
        }
        try {
            auto packet = mdns::Decode(std::span<const std::uint8_t>(buf.data(), n));
            if (packet.IsResponse()) {
                collector.Add(packet);
            }
        } catch (const ProtocolError& e) {
            spdlog::debug("Ignoring malformed mDNS packet from {}: {}",
                          sender.address().to_string(),
                          e.what());
        }
    }
    deadline.cancel();

    auto entries = collector.Entries();
    spdlog::debug("mDNS browse for {} found {} instance(s)", service_name_, entries.size());
    co_return entries;
}

} // namespace deckhand::core
