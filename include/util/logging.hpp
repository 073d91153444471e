// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace cdnscan {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the scanner.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex, since probe callbacks and the tunnel stderr
 * drain thread log concurrently with the scan loop.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Only the first call performs initialization.
  static void Initialize(const std::string& log_level = "info", bool log_to_file = false,
                         const std::string& log_file_path = "cdnscan.log");

  // Flush and drop all loggers. Later logging calls auto-reinitialize.
  static void Shutdown();

  // Get logger for a component ("scan", "probe", "tunnel", "default").
  // Unknown names fall back to the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a single component.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace cdnscan

// Convenience macros for logging
#define LOG_TRACE(...) cdnscan::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) cdnscan::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) cdnscan::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) cdnscan::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) cdnscan::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_SCAN_TRACE(...) cdnscan::util::LogManager::GetLogger("scan")->trace(__VA_ARGS__)
#define LOG_SCAN_DEBUG(...) cdnscan::util::LogManager::GetLogger("scan")->debug(__VA_ARGS__)
#define LOG_SCAN_INFO(...) cdnscan::util::LogManager::GetLogger("scan")->info(__VA_ARGS__)
#define LOG_SCAN_WARN(...) cdnscan::util::LogManager::GetLogger("scan")->warn(__VA_ARGS__)
#define LOG_SCAN_ERROR(...) cdnscan::util::LogManager::GetLogger("scan")->error(__VA_ARGS__)

#define LOG_PROBE_TRACE(...) cdnscan::util::LogManager::GetLogger("probe")->trace(__VA_ARGS__)
#define LOG_PROBE_DEBUG(...) cdnscan::util::LogManager::GetLogger("probe")->debug(__VA_ARGS__)
#define LOG_PROBE_INFO(...) cdnscan::util::LogManager::GetLogger("probe")->info(__VA_ARGS__)
#define LOG_PROBE_WARN(...) cdnscan::util::LogManager::GetLogger("probe")->warn(__VA_ARGS__)
#define LOG_PROBE_ERROR(...) cdnscan::util::LogManager::GetLogger("probe")->error(__VA_ARGS__)

#define LOG_TUNNEL_TRACE(...) cdnscan::util::LogManager::GetLogger("tunnel")->trace(__VA_ARGS__)
#define LOG_TUNNEL_DEBUG(...) cdnscan::util::LogManager::GetLogger("tunnel")->debug(__VA_ARGS__)
#define LOG_TUNNEL_INFO(...) cdnscan::util::LogManager::GetLogger("tunnel")->info(__VA_ARGS__)
#define LOG_TUNNEL_WARN(...) cdnscan::util::LogManager::GetLogger("tunnel")->warn(__VA_ARGS__)
#define LOG_TUNNEL_ERROR(...) cdnscan::util::LogManager::GetLogger("tunnel")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// A misrouted tunnel turns every member of every batch into a body-mismatch
// warning. These macros cap such messages per callsite (token bucket,
// 200 per hour) so the log stays readable over a multi-day scan.

#include "util/rate_limiter.hpp"

// Helper macro to generate callsite key from file:line
#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_WARN_RL(...)                                                                                               \
  do {                                                                                                                 \
    auto rl_verdict_ = cdnscan::util::RateLimiter::instance().check(CALLSITE_KEY_, 200, 3600);                         \
    if (rl_verdict_ == cdnscan::util::RateLimiter::Verdict::Log) {                                                     \
      cdnscan::util::LogManager::GetLogger()->warn(__VA_ARGS__);                                                       \
    } else if (rl_verdict_ == cdnscan::util::RateLimiter::Verdict::FirstSuppressed) {                                  \
      cdnscan::util::LogManager::GetLogger()->warn("further warnings from {} suppressed for now", CALLSITE_KEY_);      \
    }                                                                                                                  \
  } while (0)

#define LOG_PROBE_WARN_RL(...)                                                                                         \
  do {                                                                                                                 \
    auto rl_verdict_ = cdnscan::util::RateLimiter::instance().check(CALLSITE_KEY_, 200, 3600);                         \
    if (rl_verdict_ == cdnscan::util::RateLimiter::Verdict::Log) {                                                     \
      cdnscan::util::LogManager::GetLogger("probe")->warn(__VA_ARGS__);                                                \
    } else if (rl_verdict_ == cdnscan::util::RateLimiter::Verdict::FirstSuppressed) {                                  \
      cdnscan::util::LogManager::GetLogger("probe")->warn(                                                             \
          "further warnings from {} suppressed for now", CALLSITE_KEY_);                                               \
    }                                                                                                                  \
  } while (0)

#define LOG_TUNNEL_WARN_RL(...)                                                                                        \
  do {                                                                                                                 \
    auto rl_verdict_ = cdnscan::util::RateLimiter::instance().check(CALLSITE_KEY_, 200, 3600);                         \
    if (rl_verdict_ == cdnscan::util::RateLimiter::Verdict::Log) {                                                     \
      cdnscan::util::LogManager::GetLogger("tunnel")->warn(__VA_ARGS__);                                               \
    } else if (rl_verdict_ == cdnscan::util::RateLimiter::Verdict::FirstSuppressed) {                                  \
      cdnscan::util::LogManager::GetLogger("tunnel")->warn(                                                            \
          "further warnings from {} suppressed for now", CALLSITE_KEY_);                                               \
    }                                                                                                                  \
  } while (0)
