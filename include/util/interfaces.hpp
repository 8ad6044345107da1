// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lanwake {
namespace util {

// One IPv4 address configured on a local interface.
struct InterfaceAddress {
  std::string name;       // "eth0"
  std::string address;    // "192.168.1.4"
  std::string netmask;    // "255.255.255.0"
  std::string broadcast;  // "192.168.1.255" (empty for point-to-point links)
};

// Enumerate up, non-loopback IPv4 interface addresses (getifaddrs).
// Returns an empty list on failure.
std::vector<InterfaceAddress> ListInterfaces();

/**
 * Directed broadcast address for target_ipv4 on the first interface whose
 * subnet contains it. Falls back to computing address | ~netmask when the
 * interface reports no broadcast address. nullopt if no interface matches or
 * the target is not IPv4.
 */
std::optional<std::string> DirectedBroadcastFor(const std::string& target_ipv4,
                                                const std::vector<InterfaceAddress>& interfaces);

}  // namespace util
}  // namespace lanwake
