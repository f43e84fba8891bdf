#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/discovery/discovery_client.h>
#include <core/util/system.h>
#include <mutex>
#include <spdlog/spdlog.h>

using namespace boost::asio;

namespace deckhand::core {

DiscoveryClient::DiscoveryClient(std::unique_ptr<ServiceBrowser> browser,
                                 std::chrono::seconds stale_timeout,
                                 std::size_t event_capacity)
    : browser_(std::move(browser))
    , stale_timeout_(stale_timeout)
    , events_(event_capacity) {}

void DiscoveryClient::emit(DiscoveryEventType type, const DiscoveredAgent& agent) {
    if (!events_.TryPush(DiscoveryEvent{type, agent})) {
        spdlog::debug("Discovery event queue full, dropped event for {}", agent.info.id);
    }
}

awaitable<std::vector<DiscoveredAgent>> DiscoveryClient::Discover(std::chrono::milliseconds timeout) {
    auto entries = co_await browser_->Browse(timeout);
    auto now = Clock::now();
    std::vector<DiscoveredAgent> agents;
    for (const auto& entry : entries) {
        if (auto agent = ProcessEntry(entry, now)) {
            agents.push_back(std::move(*agent));
        }
    }
    co_return agents;
}

std::optional<DiscoveredAgent> DiscoveryClient::ProcessEntry(const ServiceEntry& entry,
                                                             Clock::time_point now) {
    ServiceInfo info;
    for (const auto& txt : entry.text) {
        auto eq = txt.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        auto key = txt.substr(0, eq);
        auto value = txt.substr(eq + 1);
        if (key == "id") {
            info.id = value;
        } else if (key == "name") {
            info.name = value;
        } else if (key == "platform") {
            info.platform = value;
        } else if (key == "version") {
            info.version = value;
        }
    }
    if (info.id.empty()) {
        info.id = entry.instance;
    }
    if (info.name.empty()) {
        info.name = entry.host;
    }
    if (info.id.empty() || entry.port == 0) {
        return std::nullopt;
    }

    std::vector<std::string> ips;
    for (const auto& ip : entry.ipv4) {
        if (system::IsUsableAddress(ip)) {
            ips.push_back(ip);
        }
    }
    if (ips.empty() && entry.host.empty()) {
        return std::nullopt;
    }
    info.port = entry.port;
    info.ips = ips;

    std::unique_lock lock(mutex_);
    auto it = agents_.find(info.id);
    if (it == agents_.end()) {
        DiscoveredAgent agent{
            .info = std::move(info),
            .host = entry.host,
            .port = entry.port,
            .ips = std::move(ips),
            .discovered_at = now,
            .last_seen = now,
        };
        agents_.emplace(agent.info.id, agent);
        spdlog::info("Discovered agent {} ({}) at {}:{}",
                     agent.info.name,
                     agent.info.id,
                     agent.Address(),
                     agent.port);
        emit(DiscoveryEventType::kDiscovered, agent);
        return agent;
    }

    auto& agent = it->second;
    agent.info = std::move(info);
    agent.host = entry.host;
    agent.port = entry.port;
    agent.ips = std::move(ips);
    agent.last_seen = now;
    emit(DiscoveryEventType::kUpdated, agent);
    return agent;
}

std::vector<DiscoveredAgent> DiscoveryClient::PruneStale(Clock::time_point now) {
    std::vector<DiscoveredAgent> pruned;
    std::unique_lock lock(mutex_);
    for (auto it = agents_.begin(); it != agents_.end();) {
        if (now - it->second.last_seen > stale_timeout_) {
            spdlog::info("Agent {} ({}) went stale", it->second.info.name, it->first);
            emit(DiscoveryEventType::kLost, it->second);
            pruned.push_back(std::move(it->second));
            it = agents_.erase(it);
        } else {
            ++it;
        }
    }
    return pruned;
}

std::vector<DiscoveredAgent> DiscoveryClient::Agents() const {
    std::shared_lock lock(mutex_);
    std::vector<DiscoveredAgent> agents;
    agents.reserve(agents_.size());
    for (const auto& [id, agent] : agents_) {
        agents.push_back(agent);
    }
    return agents;
}

std::optional<DiscoveredAgent> DiscoveryClient::GetAgent(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DiscoveryClient::RemoveAgent(const std::string& id) {
    std::unique_lock lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        return false;
    }
    emit(DiscoveryEventType::kLost, it->second);
    agents_.erase(it);
    return true;
}

awaitable<void> DiscoveryClient::StartContinuousDiscovery(std::chrono::milliseconds interval,
                                                          std::stop_token stop,
                                                          std::chrono::milliseconds browse_timeout) {
    auto executor = co_await this_coro::executor;
    auto timer = std::make_shared<steady_timer>(executor);
    std::stop_callback on_stop(stop, [timer, executor] {
        post(executor, [timer] { timer->cancel(); });
    });

    while (!stop.stop_requested()) {
        try {
            co_await Discover(browse_timeout);
        } catch (const boost::system::system_error& e) {
            spdlog::warn("Discovery browse failed: {}", e.what());
        }
        if (stop.stop_requested()) {
            break;
        }
        PruneStale();

        timer->expires_after(interval);
        boost::system::error_code ec;
        co_await timer->async_wait(redirect_error(use_awaitable, ec));
    }
    spdlog::debug("Continuous discovery stopped");
}

} // namespace deckhand::core
