#pragma once

#include <boost/asio.hpp>
#include <core/model/agent_info.h>
#include <core/network/discovery/mdns_packet.h>
#include <cstdint>
#include <string>
#include <vector>

namespace deckhand::core {

// Advertises this agent as a DNS-SD service and answers multicast queries for it
class DiscoveryServer {
public:
    DiscoveryServer(boost::asio::io_context& ioc, ServiceInfo info);
    ~DiscoveryServer();

    // Fills in the default port and local addresses when unset, then starts
    // answering. Returns false when the multicast socket cannot be set up.
    bool Start();
    // Sends a goodbye and closes the socket. Safe to call when not running.
    void Stop();

    bool running() const { return running_; }
    const ServiceInfo& info() const { return info_; }

    // "<id>._deckhand._tcp.local"
    std::string InstanceName() const;
    std::string HostName() const;

    static std::vector<std::string> TxtRecords(const ServiceInfo& info);

    // The full answer set with the given ttl; ttl 0 is a goodbye
    mdns::Packet BuildResponse(std::uint32_t ttl) const;

    // Whether any question in `query` asks about this service
    bool Matches(const mdns::Packet& query) const;

private:
    boost::asio::awaitable<void> listener();
    boost::asio::awaitable<void> announce();

    boost::asio::io_context& io_context_;
    ServiceInfo info_;
    std::string host_name_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::steady_timer announce_timer_;
    bool running_{false};
};

} // namespace deckhand::core
