#include <array>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/constant/protocol.h>
#include <core/network/discovery/discovery_server.h>
#include <core/network/discovery/service_browser.h>
#include <core/protocol/message.h>
#include <core/util/system.h>
#include <format>
#include <spdlog/spdlog.h>

using namespace boost::asio;

namespace deckhand::core {

namespace {

constexpr std::size_t kReceiveBufferSize = 9000;
constexpr int kAnnounceCount = 2;

ip::udp::endpoint multicastGroup() {
    return ip::udp::endpoint(ip::make_address(discovery::kMulticastAddress),
                             discovery::kMulticastPort);
}

} // namespace

DiscoveryServer::DiscoveryServer(io_context& ioc, ServiceInfo info)
    : io_context_(ioc)
    , info_(std::move(info))
    , socket_(ioc)
    , announce_timer_(ioc) {}

DiscoveryServer::~DiscoveryServer() {
    Stop();
}

std::string DiscoveryServer::InstanceName() const {
    return std::format("{}.{}", info_.id, ServiceName());
}

std::string DiscoveryServer::HostName() const {
    return host_name_.empty() ? std::format("{}.{}", system::Hostname(), discovery::kDomain)
                              : host_name_;
}

std::vector<std::string> DiscoveryServer::TxtRecords(const ServiceInfo& info) {
    return {
        "id=" + info.id,
        "name=" + info.name,
        "platform=" + info.platform,
        "version=" + info.version,
    };
}

mdns::Packet DiscoveryServer::BuildResponse(std::uint32_t ttl) const {
    mdns::Packet packet;
    packet.flags = mdns::kFlagResponse | mdns::kFlagAuthoritative;

    mdns::ResourceRecord ptr;
    ptr.name = ServiceName();
    ptr.type = mdns::kPtr;
    ptr.ttl = ttl;
    ptr.target = InstanceName();
    packet.answers.push_back(ptr);

    mdns::ResourceRecord srv;
    srv.name = InstanceName();
    srv.type = mdns::kSrv;
    srv.klass = mdns::kClassIn | mdns::kCacheFlush;
    srv.ttl = ttl;
    srv.port = info_.port;
    srv.target = HostName();
    packet.additionals.push_back(srv);

    mdns::ResourceRecord txt;
    txt.name = InstanceName();
    txt.type = mdns::kTxt;
    txt.klass = mdns::kClassIn | mdns::kCacheFlush;
    txt.ttl = ttl;
    txt.text = TxtRecords(info_);
    packet.additionals.push_back(txt);

    for (const auto& ip : info_.ips) {
        mdns::ResourceRecord a;
        a.name = HostName();
        a.type = mdns::kA;
        a.klass = mdns::kClassIn | mdns::kCacheFlush;
        a.ttl = ttl;
        a.address = ip;
        packet.additionals.push_back(a);
    }
    return packet;
}

bool DiscoveryServer::Matches(const mdns::Packet& query) const {
    if (query.IsResponse()) {
        return false;
    }
    for (const auto& q : query.questions) {
        bool any = q.type == mdns::kAny;
        if ((any || q.type == mdns::kPtr) && mdns::NameEquals(q.name, ServiceName())) {
            return true;
        }
        if ((any || q.type == mdns::kSrv || q.type == mdns::kTxt)
            && mdns::NameEquals(q.name, InstanceName())) {
            return true;
        }
        if ((any || q.type == mdns::kA) && mdns::NameEquals(q.name, HostName())) {
            return true;
        }
    }
    return false;
}

bool DiscoveryServer::Start() {
    if (running_) {
        return true;
    }
    if (info_.port == 0) {
        info_.port = discovery::kDefaultPort;
    }
    if (info_.ips.empty()) {
        info_.ips = system::LocalIpv4Addresses();
    } else {
        std::erase_if(info_.ips, [](const std::string& ip) { return !system::IsUsableAddress(ip); });
    }
    if (info_.ips.empty()) {
        spdlog::warn("No usable IPv4 address found, advertising host name only");
    }
    host_name_ = std::format("{}.{}", system::Hostname(), discovery::kDomain);

    try {
        ip::udp::endpoint listen_endpoint(ip::udp::v4(), discovery::kMulticastPort);
        socket_.open(listen_endpoint.protocol());
        socket_.set_option(socket_base::reuse_address(true));
        socket_.bind(listen_endpoint);
        socket_.set_option(ip::multicast::join_group(ip::make_address(discovery::kMulticastAddress)));
        socket_.set_option(ip::multicast::hops(255));
        socket_.set_option(ip::multicast::enable_loopback(true));
    } catch (const boost::system::system_error& e) {
        spdlog::error("Failed to start mDNS responder: {}", e.what());
        boost::system::error_code ignored;
        socket_.close(ignored);
        return false;
    }

    running_ = true;
    co_spawn(io_context_, listener(), detached);
    co_spawn(io_context_, announce(), detached);
    spdlog::info("Advertising {} on port {} ({})",
                 InstanceName(),
                 info_.port,
                 info_.ips.empty() ? std::string("no addresses") : info_.ips.front());
    return true;
}

void DiscoveryServer::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    announce_timer_.cancel();

    boost::system::error_code ec;
    try {
        auto goodbye = mdns::Encode(BuildResponse(0));
        socket_.send_to(buffer(goodbye), multicastGroup(), 0, ec);
    } catch (const ProtocolError& e) {
        spdlog::warn("Failed to encode mDNS goodbye: {}", e.what());
    }
    if (ec) {
        spdlog::warn("Failed to send mDNS goodbye: {}", ec.message());
    }
    socket_.close(ec);
    spdlog::info("mDNS responder stopped");
}

awaitable<void> DiscoveryServer::announce() {
    try {
        auto data = mdns::Encode(BuildResponse(discovery::kDefaultTtl));
        for (int i = 0; i < kAnnounceCount && running_; ++i) {
            co_await socket_.async_send_to(buffer(data), multicastGroup(), use_awaitable);
            announce_timer_.expires_after(std::chrono::seconds(1));
            co_await announce_timer_.async_wait(use_awaitable);
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() != error::operation_aborted) {
            spdlog::warn("mDNS announcement failed: {}", e.what());
        }
    } catch (const ProtocolError& e) {
        spdlog::error("Failed to encode mDNS announcement: {}", e.what());
    }
}

awaitable<void> DiscoveryServer::listener() {
    std::array<std::uint8_t, kReceiveBufferSize> buf;
    while (running_) {
        ip::udp::endpoint sender;
        boost::system::error_code ec;
        auto n = co_await socket_.async_receive_from(buffer(buf),
                                                     sender,
                                                     redirect_error(use_awaitable, ec));
        if (ec) {
            if (ec != error::operation_aborted && running_) {
                spdlog::error("mDNS responder receive failed: {}", ec.message());
            }
            break;
        }

        try {
            auto query = mdns::Decode(std::span<const std::uint8_t>(buf.data(), n));
            if (!Matches(query)) {
                continue;
            }
            auto response = BuildResponse(discovery::kDefaultTtl);
            ip::udp::endpoint destination = multicastGroup();
            if (sender.port() != discovery::kMulticastPort) {
                // legacy unicast query: answer the sender directly, echoing id and questions
                response.id = query.id;
                response.questions = query.questions;
                destination = sender;
            }
            auto data = mdns::Encode(response);
            co_await socket_.async_send_to(buffer(data),
                                           destination,
                                           redirect_error(use_awaitable, ec));
            if (ec) {
                spdlog::warn("mDNS reply to {} failed: {}", sender.address().to_string(), ec.message());
            }
        } catch (const ProtocolError& e) {
            spdlog::debug("Ignoring malformed mDNS packet from {}: {}",
                          sender.address().to_string(),
                          e.what());
        }
    }
}

} // namespace deckhand::core
