// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/interfaces.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <asio/ip/address_v4.hpp>

namespace lanwake {
namespace util {

namespace {

std::string ToText(const sockaddr* sa) {
  if (sa == nullptr || sa->sa_family != AF_INET) {
    return "";
  }
  char buf[INET_ADDRSTRLEN] = {};
  const auto* sin = reinterpret_cast<const sockaddr_in*>(sa);
  if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) == nullptr) {
    return "";
  }
  return std::string(buf);
}

std::optional<uint32_t> ToUint(const std::string& text) {
  asio::error_code ec;
  auto addr = asio::ip::make_address_v4(text, ec);
  if (ec) {
    return std::nullopt;
  }
  return addr.to_uint();
}

}  // namespace

std::vector<InterfaceAddress> ListInterfaces() {
  std::vector<InterfaceAddress> out;

  ifaddrs* ifaddr = nullptr;
  if (getifaddrs(&ifaddr) != 0) {
    LOG_WARN("getifaddrs failed: {}", std::strerror(errno));
    return out;
  }

  for (ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) {
      continue;
    }

    InterfaceAddress entry;
    entry.name = ifa->ifa_name ? ifa->ifa_name : "";
    entry.address = ToText(ifa->ifa_addr);
    entry.netmask = ToText(ifa->ifa_netmask);
    if (ifa->ifa_flags & IFF_BROADCAST) {
      entry.broadcast = ToText(ifa->ifa_broadaddr);
    }
    if (!entry.address.empty() && !entry.netmask.empty()) {
      out.push_back(std::move(entry));
    }
  }

  freeifaddrs(ifaddr);
  return out;
}

std::optional<std::string> DirectedBroadcastFor(const std::string& target_ipv4,
                                                const std::vector<InterfaceAddress>& interfaces) {
  auto target = ToUint(target_ipv4);
  if (!target) {
    return std::nullopt;
  }

  for (const auto& iface : interfaces) {
    auto addr = ToUint(iface.address);
    auto mask = ToUint(iface.netmask);
    if (!addr || !mask) {
      continue;
    }
    if ((*addr & *mask) != (*target & *mask)) {
      continue;
    }
    if (!iface.broadcast.empty()) {
      return iface.broadcast;
    }
    return asio::ip::address_v4(*addr | ~*mask).to_string();
  }
  return std::nullopt;
}

}  // namespace util
}  // namespace lanwake
