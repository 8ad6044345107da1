// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/mac_address.hpp"

#include "util/string_parsing.hpp"

#include <algorithm>
#include <cstdio>

namespace lanwake {
namespace util {

namespace {

// Separator layout of a textual MAC: group size in hex digits and the separator
// that must sit between groups.
struct Layout {
  size_t group;
  char sep;
};

}  // namespace

std::optional<MacAddress> MacAddress::Parse(std::string_view text) {
  Layout layout{};
  switch (text.size()) {
  case 17:  // 00:11:22:33:44:55 / 00-11-22-33-44-55
    if (text[2] != ':' && text[2] != '-') {
      return std::nullopt;
    }
    layout = {2, text[2]};
    break;
  case 14:  // 0011.2233.4455
    layout = {4, '.'};
    break;
  case 12:  // 001122334455
    layout = {12, '\0'};
    break;
  default:
    return std::nullopt;
  }

  std::string digits;
  digits.reserve(12);
  size_t in_group = 0;
  for (char c : text) {
    if (in_group == layout.group) {
      if (c != layout.sep) {
        return std::nullopt;
      }
      in_group = 0;
      continue;
    }
    if (HexValue(c) < 0) {
      return std::nullopt;
    }
    digits.push_back(c);
    ++in_group;
  }
  if (digits.size() != 12) {
    return std::nullopt;
  }

  MacAddress mac;
  for (size_t i = 0; i < 6; ++i) {
    mac.bytes[i] = static_cast<uint8_t>((HexValue(digits[2 * i]) << 4) | HexValue(digits[2 * i + 1]));
  }
  return mac;
}

std::string MacAddress::ToString() const {
  char buf[18];
  std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", bytes[0], bytes[1], bytes[2], bytes[3], bytes[4],
                bytes[5]);
  return std::string(buf);
}

bool MacAddress::IsZero() const {
  return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

}  // namespace util
}  // namespace lanwake
