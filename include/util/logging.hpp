// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace netdash {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "discovery", "probe", "config"), all
 * sharing the same sinks. Unknown component names resolve to "default".
 *
 * Thread-safety: all methods are thread-safe. Initialization runs once via
 * std::call_once; logger lookup and level changes are mutex protected.
 */
class LogManager {
public:
  // Initialize logging with the given minimum level. Only the first call
  // configures sinks; later calls are no-ops.
  static void Initialize(const std::string& log_level = "info", bool log_to_file = false,
                         const std::string& log_file_path = "netdash.log");

  // Flush and drop all loggers. Logging after shutdown re-initializes with defaults.
  static void Shutdown();

  // Get the logger for a component. Auto-initializes if needed.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level for all components.
  static void SetLogLevel(const std::string& level);

  // Set log level for one component (discovery, probe, config, default).
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace netdash

// Convenience macros for logging
#define LOG_TRACE(...) netdash::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) netdash::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) netdash::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) netdash::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) netdash::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_DISC_TRACE(...) netdash::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...) netdash::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...) netdash::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...) netdash::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)
#define LOG_DISC_ERROR(...) netdash::util::LogManager::GetLogger("discovery")->error(__VA_ARGS__)

#define LOG_PROBE_TRACE(...) netdash::util::LogManager::GetLogger("probe")->trace(__VA_ARGS__)
#define LOG_PROBE_DEBUG(...) netdash::util::LogManager::GetLogger("probe")->debug(__VA_ARGS__)
#define LOG_PROBE_WARN(...) netdash::util::LogManager::GetLogger("probe")->warn(__VA_ARGS__)

#define LOG_CONFIG_DEBUG(...) netdash::util::LogManager::GetLogger("config")->debug(__VA_ARGS__)
#define LOG_CONFIG_WARN(...) netdash::util::LogManager::GetLogger("config")->warn(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// For messages driven by output we do not control (neighbor tables, ping and
// route tools). A network with hundreds of garbled rows would otherwise log one
// line per row on every refresh cycle.
//
// Budget: 200 messages per hour per callsite (token bucket).

#include "util/rate_limiter.hpp"

#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_DISC_WARN_RL(...)                                                                                          \
  do {                                                                                                                 \
    if (netdash::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                 \
      netdash::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__);                                            \
    }                                                                                                                  \
  } while (0)

#define LOG_PROBE_WARN_RL(...)                                                                                         \
  do {                                                                                                                 \
    if (netdash::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                 \
      netdash::util::LogManager::GetLogger("probe")->warn(__VA_ARGS__);                                                \
    }                                                                                                                  \
  } while (0)
