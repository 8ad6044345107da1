// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/wol_dispatcher.hpp"

#include "hosts/registry.hpp"
#include "network/packet_sender.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"

namespace lanwake {
namespace network {

const char* WakeErrorName(WakeError error) {
  switch (error) {
  case WakeError::UnknownHost:
    return "unknown host";
  case WakeError::NoMacAddress:
    return "no MAC address";
  }
  return "unknown error";
}

size_t WakeResult::sent_count() const {
  size_t count = 0;
  for (const auto& r : results) {
    if (r.sent) {
      count++;
    }
  }
  return count;
}

WolDispatcher::WolDispatcher(hosts::Registry& registry, PacketSender& sender, WolConfig config)
    : registry_(registry), sender_(sender), config_(std::move(config)) {}

std::string WolDispatcher::broadcast_for(const hosts::HostRecord& record) const {
  if (record.broadcast) {
    return *record.broadcast;
  }
  for (const auto& address : record.addresses) {
    if (!util::IsIPv4(address)) {
      continue;
    }
    if (auto directed = util::DirectedBroadcastFor(address, config_.interfaces)) {
      return *directed;
    }
  }
  return config_.default_broadcast;
}

WakeResult WolDispatcher::wake(const std::string& identifier) {
  WakeResult result;
  result.key = identifier;

  auto key = registry_.resolve(identifier);
  const hosts::HostRecord* record = key ? registry_.record(*key) : nullptr;
  if (!record) {
    LOG_WOL_WARN_RL("Wake request for unknown host '{}'", identifier);
    result.error = WakeError::UnknownHost;
    return result;
  }
  result.key = *key;

  if (record->macs.empty()) {
    LOG_WOL_WARN_RL("Cannot wake {}: no MAC address configured", *key);
    result.error = WakeError::NoMacAddress;
    return result;
  }

  const std::string destination = broadcast_for(*record);
  const std::string target = destination + ":" + std::to_string(config_.port);

  for (const auto& mac : record->macs) {
    MagicPacket packet(mac);

    hosts::MacSendResult send_result;
    send_result.mac = mac;
    send_result.target = target;
    try {
      send_result.error = sender_.send(destination, config_.port, packet.data(), packet.size());
    } catch (const std::exception& e) {
      send_result.error = e.what();
    }
    send_result.sent = send_result.error.empty();

    if (send_result.sent) {
      LOG_WOL_INFO("Sent magic packet for {} ({}) to {}", *key, mac.ToString(), target);
    } else {
      LOG_WOL_WARN("Failed to send magic packet for {} ({}) to {}: {}", *key, mac.ToString(), target,
                   send_result.error);
    }
    result.results.push_back(std::move(send_result));
  }

  registry_.record_wake_attempt(*key, result.results);
  return result;
}

}  // namespace network
}  // namespace lanwake
