// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace lanwake {
namespace util {

// 0 means mock time is disabled
static std::atomic<int64_t> g_mock_time{0};

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

std::string FormatTime(int64_t unix_time) {
  const std::chrono::sys_seconds secs{std::chrono::seconds{unix_time}};
  const auto days = std::chrono::floor<std::chrono::days>(secs);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss hms{secs - days};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << "-" << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << "-" << std::setw(2) << static_cast<unsigned>(ymd.day()) << "T"
      << std::setw(2) << hms.hours().count() << ":" << std::setw(2) << hms.minutes().count() << ":" << std::setw(2)
      << hms.seconds().count() << "Z";
  return oss.str();
}

std::string FormatAge(int64_t seconds) {
  if (seconds < 0) {
    seconds = 0;
  }
  if (seconds >= 86400) {
    return std::to_string(seconds / 86400) + " d";
  }
  if (seconds >= 3600) {
    return std::to_string(seconds / 3600) + " h";
  }
  if (seconds >= 60) {
    return std::to_string(seconds / 60) + " m";
  }
  return std::to_string(seconds) + " s";
}

}  // namespace util
}  // namespace lanwake
