// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace lanwake {
namespace network {

/**
 * PacketSender - abstract sink for one-shot UDP datagrams
 *
 * The wake dispatcher only builds payloads and picks destinations; getting
 * bytes onto the wire goes through this interface so tests can capture the
 * datagrams instead of broadcasting them.
 */
class PacketSender {
public:
  virtual ~PacketSender() = default;

  // Send one datagram. Returns an empty string on success, otherwise a
  // description of the failure. Must not throw.
  virtual std::string send(const std::string& address, uint16_t port, const uint8_t* data, size_t len) = 0;
};

/**
 * UdpBroadcastSender - asio UDP socket with SO_BROADCAST
 *
 * A fresh socket per datagram; wake requests are rare and a fresh socket
 * picks up interface changes without any bookkeeping.
 */
class UdpBroadcastSender : public PacketSender {
public:
  std::string send(const std::string& address, uint16_t port, const uint8_t* data, size_t len) override;
};

}  // namespace network
}  // namespace lanwake
