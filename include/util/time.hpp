// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace lanwake {
namespace util {

// Current unix time in seconds, or the mock time when one is set.
// Every timestamp stored in NetworkState comes from here.
int64_t GetTime();

// Set mock time (0 disables mocking and returns to the system clock).
void SetMockTime(int64_t time);

int64_t GetMockTime();

// "2025-01-31T08:15:00Z"
std::string FormatTime(int64_t unix_time);

// Coarse human age of a duration in seconds: "12 s", "4 m", "3 h", "2 d".
std::string FormatAge(int64_t seconds);

// RAII mock time for tests; restores the previous mock value on exit.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace lanwake
