#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/udp.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace deckhand::core {

// One resolved DNS-SD service instance
struct ServiceEntry {
    std::string instance; // leading label only, e.g. "a1"
    std::string host;     // e.g. "steamdeck.local"
    std::uint16_t port = 0;
    std::vector<std::string> text;
    std::vector<std::string> ipv4;
};

class ServiceBrowser {
public:
    virtual ~ServiceBrowser() = default;

    // Collects every instance that answers before `timeout` elapses
    virtual boost::asio::awaitable<std::vector<ServiceEntry>> Browse(
        std::chrono::milliseconds timeout) = 0;
};

// Fully qualified service name, e.g. "_deckhand._tcp.local"
std::string ServiceName();

// The mDNS group, 224.0.0.251:5353
boost::asio::ip::udp::endpoint MdnsGroup();

// One-shot multicast DNS browser. Queries are sent from an ephemeral port so
// responders answer by unicast.
class MdnsBrowser : public ServiceBrowser {
public:
    explicit MdnsBrowser(boost::asio::any_io_executor executor,
                         std::string service_name = ServiceName(),
                         boost::asio::ip::udp::endpoint query_to = MdnsGroup());

    boost::asio::awaitable<std::vector<ServiceEntry>> Browse(
        std::chrono::milliseconds timeout) override;

private:
    boost::asio::any_io_executor executor_;
    std::string service_name_;
    boost::asio::ip::udp::endpoint query_to_;
};

} // namespace deckhand::core
