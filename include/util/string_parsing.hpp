// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lanwake {
namespace util {

// Strict decimal parsers: the whole string must be consumed, no sign on
// unsigned values, no surrounding whitespace.
std::optional<uint16_t> SafeParsePort(std::string_view str);
std::optional<int64_t> SafeParseInt64(std::string_view str);
std::optional<uint32_t> SafeParseUInt32(std::string_view str);

std::string_view TrimWhitespace(std::string_view str);

// Split on runs of spaces/tabs; empty tokens are never returned.
std::vector<std::string_view> SplitWhitespace(std::string_view str);

// Text before the first '#', for hosts(5)/ethers(5) style lines.
std::string_view StripComment(std::string_view line);

// Value of one hex digit (either case), or -1
int HexValue(char c);

std::string ToLower(std::string_view str);

}  // namespace util
}  // namespace lanwake
