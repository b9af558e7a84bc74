// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace almond {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * (default, transport, rpc, robot, teleop, app).
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "almond.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown fall back to a silent console logger.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "transport", "rpc", "robot")
   *
   * Auto-initializes if not initialized. Unknown names return the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (transport, rpc, robot, teleop, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace almond

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  almond::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  almond::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  almond::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  almond::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  almond::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_TRANSPORT_TRACE(...)                                               \
  almond::util::LogManager::GetLogger("transport")->trace(__VA_ARGS__)
#define LOG_TRANSPORT_DEBUG(...)                                               \
  almond::util::LogManager::GetLogger("transport")->debug(__VA_ARGS__)
#define LOG_TRANSPORT_INFO(...)                                                \
  almond::util::LogManager::GetLogger("transport")->info(__VA_ARGS__)
#define LOG_TRANSPORT_WARN(...)                                                \
  almond::util::LogManager::GetLogger("transport")->warn(__VA_ARGS__)
#define LOG_TRANSPORT_ERROR(...)                                               \
  almond::util::LogManager::GetLogger("transport")->error(__VA_ARGS__)

#define LOG_RPC_TRACE(...)                                                     \
  almond::util::LogManager::GetLogger("rpc")->trace(__VA_ARGS__)
#define LOG_RPC_DEBUG(...)                                                     \
  almond::util::LogManager::GetLogger("rpc")->debug(__VA_ARGS__)
#define LOG_RPC_INFO(...)                                                      \
  almond::util::LogManager::GetLogger("rpc")->info(__VA_ARGS__)
#define LOG_RPC_WARN(...)                                                      \
  almond::util::LogManager::GetLogger("rpc")->warn(__VA_ARGS__)
#define LOG_RPC_ERROR(...)                                                     \
  almond::util::LogManager::GetLogger("rpc")->error(__VA_ARGS__)

#define LOG_ROBOT_DEBUG(...)                                                   \
  almond::util::LogManager::GetLogger("robot")->debug(__VA_ARGS__)
#define LOG_ROBOT_INFO(...)                                                    \
  almond::util::LogManager::GetLogger("robot")->info(__VA_ARGS__)
#define LOG_ROBOT_WARN(...)                                                    \
  almond::util::LogManager::GetLogger("robot")->warn(__VA_ARGS__)

#define LOG_TELEOP_DEBUG(...)                                                  \
  almond::util::LogManager::GetLogger("teleop")->debug(__VA_ARGS__)
#define LOG_TELEOP_INFO(...)                                                   \
  almond::util::LogManager::GetLogger("teleop")->info(__VA_ARGS__)
#define LOG_TELEOP_WARN(...)                                                   \
  almond::util::LogManager::GetLogger("teleop")->warn(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  almond::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  almond::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  almond::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
