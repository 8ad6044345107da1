// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include "util/time.hpp"

#include <algorithm>

namespace lanwake {
namespace util {

bool RateLimiter::should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds) {
  if (tokens_per_period <= 0 || period_seconds <= 0) {
    return true;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  const int64_t now = GetTime();
  auto& bucket = buckets_[callsite_key];

  if (!bucket.initialized) {
    bucket.tokens = static_cast<double>(tokens_per_period);
    bucket.last_refill = now;
    bucket.initialized = true;
  }

  // Clock stepped backwards: restart the refill window instead of refilling
  if (now < bucket.last_refill) {
    bucket.last_refill = now;
  }

  const int64_t elapsed = now - bucket.last_refill;
  if (elapsed > 0) {
    const double refill_rate = static_cast<double>(tokens_per_period) / period_seconds;
    bucket.tokens = std::min(bucket.tokens + refill_rate * static_cast<double>(elapsed),
                             static_cast<double>(tokens_per_period));
    bucket.last_refill = now;
  }

  if (bucket.tokens >= 1.0) {
    bucket.tokens -= 1.0;
    return true;
  }

  ++bucket.suppressed;
  return false;
}

uint64_t RateLimiter::suppressed(const std::string& callsite_key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(callsite_key);
  return it == buckets_.end() ? 0 : it->second.suppressed;
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter instance;
  return instance;
}

}  // namespace util
}  // namespace lanwake
