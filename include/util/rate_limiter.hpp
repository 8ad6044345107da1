// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Per-callsite token bucket used by the *_RL logging macros

#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace lanwake {
namespace util {

/**
 * RateLimiter - Token bucket rate limiter for logging
 *
 * Each callsite (file:line) owns a bucket holding up to tokens_per_period
 * tokens. A bucket starts full and refills linearly over period_seconds,
 * measured on the mockable wall clock (util::GetTime), so tests can advance
 * time with SetMockTime().
 *
 * A host that has been unplugged fails its probe every few seconds forever.
 * Without a limit that is one warning per cycle for the life of the process.
 */
class RateLimiter {
public:
  // Returns true if a message from callsite_key may be logged now.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  // Number of messages rejected so far for a callsite.
  uint64_t suppressed(const std::string& callsite_key) const;

  // Process-wide instance used by the logging macros.
  static RateLimiter& instance();

private:
  struct TokenBucket {
    double tokens{0.0};
    int64_t last_refill{0};
    uint64_t suppressed{0};
    bool initialized{false};
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace util
}  // namespace lanwake
