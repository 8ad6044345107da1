// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lanwake {
namespace util {

/**
 * MacAddress - 48-bit IEEE 802 hardware address
 *
 * Accepted input forms (hex digits in either case):
 *   00:11:22:33:44:55   00-11-22-33-44-55   0011.2233.4455   001122334455
 * The canonical text form is lowercase, colon separated. Two addresses that
 * differ only in case or separator compare equal.
 */
struct MacAddress {
  std::array<uint8_t, 6> bytes{};

  MacAddress() = default;
  explicit MacAddress(const std::array<uint8_t, 6>& b) : bytes(b) {}

  static std::optional<MacAddress> Parse(std::string_view text);

  std::string ToString() const;

  // Multicast/broadcast MACs (I/G bit set) cannot identify a NIC to wake.
  bool IsGroup() const { return (bytes[0] & 0x01) != 0; }
  bool IsZero() const;

  auto operator<=>(const MacAddress&) const = default;
};

}  // namespace util
}  // namespace lanwake
