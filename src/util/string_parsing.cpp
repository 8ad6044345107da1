// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <cctype>
#include <charconv>
#include <limits>

namespace lanwake {
namespace util {

namespace {

bool IsBlank(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

template <typename T>
std::optional<T> ParseDecimal(std::string_view str) {
  if (str.empty() || str.size() > 20) {
    return std::nullopt;
  }
  // from_chars accepts a leading '-' for signed types only; reject '+' and whitespace everywhere
  if (str.front() == '+' || IsBlank(str.front())) {
    return std::nullopt;
  }

  T value{};
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc() || ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<uint16_t> SafeParsePort(std::string_view str) {
  auto value = ParseDecimal<uint32_t>(str);
  if (!value || *value == 0 || *value > std::numeric_limits<uint16_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<int64_t> SafeParseInt64(std::string_view str) {
  return ParseDecimal<int64_t>(str);
}

std::optional<uint32_t> SafeParseUInt32(std::string_view str) {
  return ParseDecimal<uint32_t>(str);
}

std::string_view TrimWhitespace(std::string_view str) {
  while (!str.empty() && IsBlank(str.front())) {
    str.remove_prefix(1);
  }
  while (!str.empty() && IsBlank(str.back())) {
    str.remove_suffix(1);
  }
  return str;
}

std::vector<std::string_view> SplitWhitespace(std::string_view str) {
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < str.size()) {
    while (i < str.size() && IsBlank(str[i])) {
      ++i;
    }
    size_t start = i;
    while (i < str.size() && !IsBlank(str[i])) {
      ++i;
    }
    if (i > start) {
      out.push_back(str.substr(start, i - start));
    }
  }
  return out;
}

std::string_view StripComment(std::string_view line) {
  auto pos = line.find('#');
  if (pos != std::string_view::npos) {
    line = line.substr(0, pos);
  }
  return line;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::string ToLower(std::string_view str) {
  std::string out(str);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

}  // namespace util
}  // namespace lanwake
