// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/magic_packet.hpp"

#include <algorithm>

namespace lanwake {
namespace network {

MagicPacket::MagicPacket(const util::MacAddress& mac) : target_(mac) {
  std::fill_n(bytes_.begin(), MAGIC_PACKET_SYNC_LEN, uint8_t{0xFF});

  auto out = bytes_.begin() + MAGIC_PACKET_SYNC_LEN;
  for (size_t i = 0; i < MAGIC_PACKET_REPEAT; ++i) {
    out = std::copy(mac.bytes.begin(), mac.bytes.end(), out);
  }
}

}  // namespace network
}  // namespace lanwake
