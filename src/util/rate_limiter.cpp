// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Rate limiter implementation

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace cdnscan {
namespace util {

bool RateLimiter::should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds) {
  return check(callsite_key, tokens_per_period, period_seconds) == Verdict::Log;
}

bool RateLimiter::should_log_at(const std::string& callsite_key, int tokens_per_period, int period_seconds,
                                Clock::time_point now) {
  return check_at(callsite_key, tokens_per_period, period_seconds, now) == Verdict::Log;
}

RateLimiter::Verdict RateLimiter::check(const std::string& callsite_key, int tokens_per_period, int period_seconds) {
  return check_at(callsite_key, tokens_per_period, period_seconds, Clock::now());
}

RateLimiter::Verdict RateLimiter::check_at(const std::string& callsite_key, int tokens_per_period, int period_seconds,
                                           Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto& bucket = buckets_[callsite_key];

  // First access starts with full capacity (burst)
  if (!bucket.initialized) {
    bucket.tokens = static_cast<double>(tokens_per_period);
    bucket.last_refill = now;
    bucket.initialized = true;
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - bucket.last_refill).count();
  if (elapsed > 0 && period_seconds > 0) {
    double refill_rate = static_cast<double>(tokens_per_period) / period_seconds;
    bucket.tokens = std::min(bucket.tokens + (refill_rate * elapsed), static_cast<double>(tokens_per_period));
    bucket.last_refill = now;
  }

  if (bucket.tokens >= 1.0) {
    bucket.tokens -= 1.0;
    bucket.suppressing = false;
    return Verdict::Log;
  }

  if (!bucket.suppressing) {
    bucket.suppressing = true;
    return Verdict::FirstSuppressed;
  }
  return Verdict::Suppressed;
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter instance;
  return instance;
}

}  // namespace util
}  // namespace cdnscan
