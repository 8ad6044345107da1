// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings before they enter a HostRecord
 - Split "host:port" bind addresses
 - Classify addresses the prober must never target

 Addresses are carried as normalized strings throughout the registry so that
 "192.168.1.10" and "::ffff:192.168.1.10" are one identifier, not two hosts.
*/

#include <cstdint>
#include <optional>
#include <string>

namespace lanwake {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * 1. Validates that the string is a numeric IPv4 or IPv6 address
 * 2. Normalizes IPv4-mapped IPv6 addresses to IPv4 (::ffff:1.2.3.4 -> 1.2.3.4)
 * 3. Returns the canonical string representation (lowercase, compressed IPv6)
 *
 * Examples:
 *   "192.168.1.1"        -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:DB8:0::1"      -> "2001:db8::1"
 *   "router.lan"         -> std::nullopt (hostnames are not addresses)
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

bool IsValidIPAddress(const std::string& address);

// True for a valid, normalized IPv4 address.
bool IsIPv4(const std::string& address);

/**
 * Split "host:port" into its parts. The host may be an IPv4 address, a
 * hostname, or a bracketed IPv6 address ("[::1]:3000"). Numeric hosts are
 * normalized; hostnames are returned unchanged for the resolver.
 */
bool ParseHostPort(const std::string& host_port, std::string& out_host, uint16_t& out_port);

/**
 * Whether an address is a sensible reachability target: not unspecified,
 * not multicast, not the IPv4 limited broadcast. Loopback is allowed.
 */
bool IsProbeableAddress(const std::string& address);

// 127.0.0.0/8 and ::1
bool IsLoopbackAddress(const std::string& address);

}  // namespace util
}  // namespace lanwake
