// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace lanwake {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "hosts", "probe", "wol", "http").
 * All loggers share the same sinks: a colored stdout sink and, when
 * requested, a plain file sink.
 *
 * Thread-safety: All methods are thread-safe. Initialize() applies once
 * per Shutdown() cycle.
 */
class LogManager {
public:
  // Initialize logging with the given minimum level.
  // Only the first call after startup or Shutdown() performs initialization.
  static void Initialize(const std::string& log_level = "info", bool log_to_file = false,
                         const std::string& log_file_path = "lanwake.log");

  // Flush and drop all loggers. A later Initialize() applies its settings;
  // GetLogger() before that falls back to console-only loggers at info.
  static void Shutdown();

  // Get logger for a component. Unknown components get the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a single component.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace lanwake

#define LOG_TRACE(...) lanwake::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) lanwake::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) lanwake::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) lanwake::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) lanwake::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_HOSTS_TRACE(...) lanwake::util::LogManager::GetLogger("hosts")->trace(__VA_ARGS__)
#define LOG_HOSTS_DEBUG(...) lanwake::util::LogManager::GetLogger("hosts")->debug(__VA_ARGS__)
#define LOG_HOSTS_INFO(...) lanwake::util::LogManager::GetLogger("hosts")->info(__VA_ARGS__)
#define LOG_HOSTS_WARN(...) lanwake::util::LogManager::GetLogger("hosts")->warn(__VA_ARGS__)
#define LOG_HOSTS_ERROR(...) lanwake::util::LogManager::GetLogger("hosts")->error(__VA_ARGS__)

#define LOG_PROBE_TRACE(...) lanwake::util::LogManager::GetLogger("probe")->trace(__VA_ARGS__)
#define LOG_PROBE_DEBUG(...) lanwake::util::LogManager::GetLogger("probe")->debug(__VA_ARGS__)
#define LOG_PROBE_INFO(...) lanwake::util::LogManager::GetLogger("probe")->info(__VA_ARGS__)
#define LOG_PROBE_WARN(...) lanwake::util::LogManager::GetLogger("probe")->warn(__VA_ARGS__)
#define LOG_PROBE_ERROR(...) lanwake::util::LogManager::GetLogger("probe")->error(__VA_ARGS__)

#define LOG_WOL_DEBUG(...) lanwake::util::LogManager::GetLogger("wol")->debug(__VA_ARGS__)
#define LOG_WOL_INFO(...) lanwake::util::LogManager::GetLogger("wol")->info(__VA_ARGS__)
#define LOG_WOL_WARN(...) lanwake::util::LogManager::GetLogger("wol")->warn(__VA_ARGS__)
#define LOG_WOL_ERROR(...) lanwake::util::LogManager::GetLogger("wol")->error(__VA_ARGS__)

#define LOG_HTTP_TRACE(...) lanwake::util::LogManager::GetLogger("http")->trace(__VA_ARGS__)
#define LOG_HTTP_DEBUG(...) lanwake::util::LogManager::GetLogger("http")->debug(__VA_ARGS__)
#define LOG_HTTP_INFO(...) lanwake::util::LogManager::GetLogger("http")->info(__VA_ARGS__)
#define LOG_HTTP_WARN(...) lanwake::util::LogManager::GetLogger("http")->warn(__VA_ARGS__)
#define LOG_HTTP_ERROR(...) lanwake::util::LogManager::GetLogger("http")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// A host that stays unreachable fails its probe every cycle, and an HTTP
// client can hammer the wake endpoint. Messages triggered by either go
// through these macros so that one misbehaving host or client cannot flood
// the log. Budget: 60 messages per callsite per 10 minutes.

#include "util/rate_limiter.hpp"

#define LANWAKE_CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LANWAKE_LOG_RL_(component, level, ...)                                                                     \
  do {                                                                                                             \
    if (lanwake::util::RateLimiter::instance().should_log(LANWAKE_CALLSITE_KEY_, 60, 600)) {                       \
      lanwake::util::LogManager::GetLogger(component)->level(__VA_ARGS__);                                         \
    }                                                                                                              \
  } while (0)

#define LOG_WARN_RL(...) LANWAKE_LOG_RL_("default", warn, __VA_ARGS__)
#define LOG_PROBE_WARN_RL(...) LANWAKE_LOG_RL_("probe", warn, __VA_ARGS__)
#define LOG_PROBE_ERROR_RL(...) LANWAKE_LOG_RL_("probe", error, __VA_ARGS__)
#define LOG_WOL_WARN_RL(...) LANWAKE_LOG_RL_("wol", warn, __VA_ARGS__)
#define LOG_HTTP_WARN_RL(...) LANWAKE_LOG_RL_("http", warn, __VA_ARGS__)
