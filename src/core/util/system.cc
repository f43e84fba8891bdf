#include <arpa/inet.h>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <core/util/system.h>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <spdlog/spdlog.h>
#include <string>

namespace deckhand::core {

namespace system {

namespace {

// Value of a key in /etc/os-release, unquoted
std::string osReleaseValue(std::string_view key) {
    std::ifstream file("/etc/os-release");
    std::string line;
    while (std::getline(file, line)) {
        if (line.size() > key.size() && line.starts_with(key) && line[key.size()] == '=') {
            std::string value = line.substr(key.size() + 1);
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            return value;
        }
    }
    return {};
}

} // namespace

std::string Hostname() {
    std::string hostname = boost::asio::ip::host_name();
    if (hostname.ends_with(".local")) {
        hostname = hostname.substr(0, hostname.size() - 6);
    } else if (hostname.ends_with(".localdomain")) {
        hostname = hostname.substr(0, hostname.size() - 12);
    }
    return hostname;
}

std::string Platform() {
#if defined(_WIN32) || defined(_WIN64)
    return "windows";
#elif defined(__APPLE__)
    return "macos";
#else
    auto id = osReleaseValue("ID");
    auto variant = osReleaseValue("VARIANT_ID");
    if (id == "steamos" || variant == "steamdeck") {
        return "steamdeck";
    }
    return "linux";
#endif
}

std::string OperatingSystem() {
    constexpr auto architecture =
#if defined(__x86_64__) || defined(_M_X64)
        "x86_64";
#elif defined(__aarch64__)
        "aarch64";
#elif defined(__arm__)
        "arm";
#else
        "Unknown";
#endif

    auto pretty_name = osReleaseValue("PRETTY_NAME");
    if (pretty_name.empty()) {
        return std::format("Linux ({})", architecture);
    }
    return std::format("{} ({})", pretty_name, architecture);
}

bool IsLinkLocal(const std::string& ipv4) {
    return ipv4.starts_with("169.254.");
}

bool IsUsableAddress(const std::string& ipv4) {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address_v4(ipv4, ec);
    if (ec) {
        return false;
    }
    return !address.is_loopback() && !address.is_unspecified() && !IsLinkLocal(ipv4);
}

std::vector<std::string> LocalIpv4Addresses() {
    std::vector<std::string> addresses;
    ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        spdlog::error("getifaddrs failed: {}", std::strerror(errno));
        return addresses;
    }
    for (auto* it = interfaces; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        char buffer[INET_ADDRSTRLEN] = {};
        auto* sin = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, buffer, sizeof(buffer)) == nullptr) {
            continue;
        }
        std::string address(buffer);
        if (IsUsableAddress(address)) {
            addresses.push_back(std::move(address));
        }
    }
    freeifaddrs(interfaces);
    return addresses;
}

} // namespace system

} // namespace deckhand::core
