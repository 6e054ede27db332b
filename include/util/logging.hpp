// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace llmmonitor {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the application.
 *
 * Thread-safety: All methods are thread-safe. Initialization and
 * logger lookup are protected by one mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Multiple calls are safe; only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "llmmonitor.log");

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "discovery", "poll", "app")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (discovery, poll, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);
};

} // namespace util
} // namespace llmmonitor

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  llmmonitor::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  llmmonitor::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  llmmonitor::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  llmmonitor::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  llmmonitor::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  llmmonitor::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_DISC_TRACE(...)                                                    \
  llmmonitor::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...)                                                    \
  llmmonitor::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...)                                                     \
  llmmonitor::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...)                                                     \
  llmmonitor::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)
#define LOG_DISC_ERROR(...)                                                    \
  llmmonitor::util::LogManager::GetLogger("discovery")->error(__VA_ARGS__)

#define LOG_POLL_TRACE(...)                                                    \
  llmmonitor::util::LogManager::GetLogger("poll")->trace(__VA_ARGS__)
#define LOG_POLL_DEBUG(...)                                                    \
  llmmonitor::util::LogManager::GetLogger("poll")->debug(__VA_ARGS__)
#define LOG_POLL_INFO(...)                                                     \
  llmmonitor::util::LogManager::GetLogger("poll")->info(__VA_ARGS__)
#define LOG_POLL_WARN(...)                                                     \
  llmmonitor::util::LogManager::GetLogger("poll")->warn(__VA_ARGS__)
#define LOG_POLL_ERROR(...)                                                    \
  llmmonitor::util::LogManager::GetLogger("poll")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  llmmonitor::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  llmmonitor::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  llmmonitor::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
