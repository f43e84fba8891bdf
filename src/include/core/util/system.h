#pragma once

#include <string>
#include <vector>

namespace deckhand::core {

namespace system {

std::string Hostname();
std::string Platform(); // "linux", "windows", "macos" or "steamdeck"
std::string OperatingSystem(); // etc: SteamOS (x86_64)

// Non-loopback IPv4 addresses of the local interfaces, link-local (169.254/16) excluded
std::vector<std::string> LocalIpv4Addresses();

bool IsLinkLocal(const std::string& ipv4);
bool IsUsableAddress(const std::string& ipv4);

} // namespace system

} // namespace deckhand::core
