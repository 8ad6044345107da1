// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 WolDispatcher: sends Wake-on-LAN magic packets for a registry host

 One UDP datagram per MAC address, to the host's broadcast scope:
   1. the host's configured `broadcast` address
   2. else the directed broadcast of the local interface whose subnet
      contains one of the host's IPv4 addresses
   3. else WolConfig::default_broadcast (255.255.255.255)

 Delivery is not confirmed; "sent" means the datagram left the socket. A send
 failure for one MAC never stops the remaining MACs. Ignored hosts are only
 excluded from probing and can still be woken.
*/

#include "hosts/host_record.hpp"
#include "network/magic_packet.hpp"
#include "util/interfaces.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lanwake {
namespace hosts {
class Registry;
}  // namespace hosts

namespace network {

class PacketSender;

enum class WakeError {
  UnknownHost,
  NoMacAddress,
};

const char* WakeErrorName(WakeError error);

struct WakeResult {
  std::string key;  // canonical key when the host was found
  std::optional<WakeError> error;
  std::vector<hosts::MacSendResult> results;  // one per MAC, in MAC order

  bool ok() const { return !error.has_value(); }
  size_t sent_count() const;
};

struct WolConfig {
  uint16_t port{DEFAULT_WOL_PORT};
  std::string default_broadcast{"255.255.255.255"};
  // Local IPv4 interfaces used to find directed broadcast addresses
  std::vector<util::InterfaceAddress> interfaces;
};

class WolDispatcher {
public:
  WolDispatcher(hosts::Registry& registry, PacketSender& sender, WolConfig config = {});

  // Wake a host by canonical key or by any alias, address or MAC of it.
  WakeResult wake(const std::string& identifier);

  // Broadcast address wake packets for this host are sent to
  std::string broadcast_for(const hosts::HostRecord& record) const;

  const WolConfig& config() const { return config_; }

private:
  hosts::Registry& registry_;
  PacketSender& sender_;
  WolConfig config_;
};

}  // namespace network
}  // namespace lanwake
