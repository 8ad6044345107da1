// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/netaddress.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <asio/ip/address.hpp>

namespace lanwake {
namespace util {

namespace {

std::optional<asio::ip::address> ParseAddress(const std::string& address) {
  asio::error_code ec;
  auto ip = asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }
  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    return asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6());
  }
  return ip;
}

}  // namespace

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    auto ip = ParseAddress(address);
    if (!ip) {
      return std::nullopt;
    }
    return ip->to_string();
  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

bool IsIPv4(const std::string& address) {
  auto ip = ParseAddress(address);
  return ip && ip->is_v4();
}

bool ParseHostPort(const std::string& host_port, std::string& out_host, uint16_t& out_port) {
  if (host_port.empty()) {
    return false;
  }

  // "[IPv6]:port"
  if (host_port[0] == '[') {
    size_t bracket_end = host_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false;
    }
    if (bracket_end + 1 >= host_port.size() || host_port[bracket_end + 1] != ':') {
      return false;
    }

    auto port = SafeParsePort(std::string_view(host_port).substr(bracket_end + 2));
    if (!port) {
      return false;
    }

    auto normalized = ValidateAndNormalizeIP(host_port.substr(1, bracket_end - 1));
    if (!normalized) {
      return false;
    }
    out_host = *normalized;
    out_port = *port;
    return true;
  }

  // "host:port" - more than one colon means an unbracketed IPv6 address
  size_t colon = host_port.find(':');
  if (colon == std::string::npos || colon == 0) {
    return false;
  }
  if (host_port.find(':', colon + 1) != std::string::npos) {
    return false;
  }

  auto port = SafeParsePort(std::string_view(host_port).substr(colon + 1));
  if (!port) {
    return false;
  }

  std::string host = host_port.substr(0, colon);
  if (auto normalized = ValidateAndNormalizeIP(host)) {
    host = *normalized;
  }

  out_host = host;
  out_port = *port;
  return true;
}

bool IsProbeableAddress(const std::string& address) {
  auto ip = ParseAddress(address);
  if (!ip) {
    return false;
  }
  if (ip->is_unspecified() || ip->is_multicast()) {
    return false;
  }
  if (ip->is_v4() && ip->to_v4() == asio::ip::address_v4::broadcast()) {
    return false;
  }
  return true;
}

bool IsLoopbackAddress(const std::string& address) {
  auto ip = ParseAddress(address);
  return ip && ip->is_loopback();
}

}  // namespace util
}  // namespace lanwake
