// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/mac_address.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace lanwake {
namespace network {

// Wake-on-LAN payload: 6 bytes of 0xFF, then the target MAC 16 times
constexpr size_t MAGIC_PACKET_SYNC_LEN = 6;
constexpr size_t MAGIC_PACKET_REPEAT = 16;
constexpr size_t MAGIC_PACKET_SIZE = MAGIC_PACKET_SYNC_LEN + MAGIC_PACKET_REPEAT * 6;  // 102

constexpr uint16_t DEFAULT_WOL_PORT = 9;  // discard

class MagicPacket {
public:
  explicit MagicPacket(const util::MacAddress& mac);

  const std::array<uint8_t, MAGIC_PACKET_SIZE>& bytes() const { return bytes_; }
  const uint8_t* data() const { return bytes_.data(); }
  size_t size() const { return bytes_.size(); }

  const util::MacAddress& target() const { return target_; }

private:
  util::MacAddress target_;
  std::array<uint8_t, MAGIC_PACKET_SIZE> bytes_{};
};

}  // namespace network
}  // namespace lanwake
