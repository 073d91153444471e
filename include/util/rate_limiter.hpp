// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Rate limiter for repetitive log messages

#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cdnscan {
namespace util {

/**
 * RateLimiter - Token bucket rate limiter for logging
 *
 * Each callsite gets N tokens that refill linearly over a period.
 * With 200 tokens per hour, a burst of 200 body-mismatch warnings is
 * logged, after which roughly one message every 18 seconds gets through.
 * check() reports the first dropped message of each run so the caller can
 * say that further warnings are being suppressed.
 */
class RateLimiter {
public:
  using Clock = std::chrono::steady_clock;

  enum class Verdict {
    Log,
    FirstSuppressed,  // first message dropped since the bucket last emptied
    Suppressed,
  };

  Verdict check(const std::string& callsite_key, int tokens_per_period, int period_seconds);
  Verdict check_at(const std::string& callsite_key, int tokens_per_period, int period_seconds, Clock::time_point now);

  // Returns true if a message from callsite_key may be logged now.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  // Same as should_log() with an explicit clock reading (used by tests).
  bool should_log_at(const std::string& callsite_key, int tokens_per_period, int period_seconds,
                     Clock::time_point now);

  // Get singleton instance.
  static RateLimiter& instance();

private:
  struct TokenBucket {
    double tokens{0.0};
    Clock::time_point last_refill{};
    bool initialized{false};
    bool suppressing{false};
  };

  std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace util
}  // namespace cdnscan
