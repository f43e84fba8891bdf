#pragma once

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <core/constant/protocol.h>
#include <core/model/discovery_event.h>
#include <core/network/discovery/service_browser.h>
#include <core/util/event_queue.h>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace deckhand::core {

// Hub-side registry of agents seen on the network
class DiscoveryClient {
public:
    using Clock = std::chrono::steady_clock;

    explicit DiscoveryClient(std::unique_ptr<ServiceBrowser> browser,
                             std::chrono::seconds stale_timeout = discovery::kStaleTimeout,
                             std::size_t event_capacity = discovery::kEventQueueCapacity);

    // One browse; every answering agent is upserted and returned
    boost::asio::awaitable<std::vector<DiscoveredAgent>> Discover(
        std::chrono::milliseconds timeout = discovery::kBrowseTimeout);

    // Browses now and then every `interval`, pruning stale agents after each
    // round, until `stop` is requested
    boost::asio::awaitable<void> StartContinuousDiscovery(
        std::chrono::milliseconds interval,
        std::stop_token stop,
        std::chrono::milliseconds browse_timeout = discovery::kBrowseTimeout);

    // Upserts one browse result. Returns nothing for entries with no usable
    // port or address.
    std::optional<DiscoveredAgent> ProcessEntry(const ServiceEntry& entry,
                                                Clock::time_point now = Clock::now());

    // Drops agents not seen within the stale timeout, one lost event each
    std::vector<DiscoveredAgent> PruneStale(Clock::time_point now = Clock::now());

    std::vector<DiscoveredAgent> Agents() const;
    std::optional<DiscoveredAgent> GetAgent(const std::string& id) const;
    bool RemoveAgent(const std::string& id);

    EventQueue<DiscoveryEvent>& events() { return events_; }

private:
    void emit(DiscoveryEventType type, const DiscoveredAgent& agent);

    std::unique_ptr<ServiceBrowser> browser_;
    const std::chrono::seconds stale_timeout_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, DiscoveredAgent> agents_;
    EventQueue<DiscoveryEvent> events_;
};

} // namespace deckhand::core
