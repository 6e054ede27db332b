// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace llmmonitor {
namespace util {

namespace {

std::recursive_mutex s_mutex;
bool s_initialized = false;
std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

const std::vector<std::string> kComponents = {"default", "discovery", "poll",
                                              "app"};

} // namespace

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (s_initialized) {
    return;
  }

  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (log_to_file) {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          log_file_path, false); // false = append mode
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      sinks.push_back(file_sink);
    } else {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      sinks.push_back(console_sink);
    }

    for (const auto &component : kComponents) {
      // Replace a stale registration left behind by a previous session
      spdlog::drop(component);
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(spdlog::level::from_str(log_level));
      logger->flush_on(spdlog::level::info);
      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }

    spdlog::set_default_logger(s_loggers["default"]);
    s_initialized = true;

    LOG_DEBUG("Logging system initialized (level: {})", log_level);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

void LogManager::Shutdown() {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (!s_initialized) {
    return;
  }

  for (auto &[name, logger] : s_loggers) {
    logger->flush();
  }
  s_loggers.clear();
  spdlog::drop_all();
  s_initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (!s_initialized) {
    // Auto-initialize with defaults if not initialized
    Initialize();
  }

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  auto fallback = s_loggers.find("default");
  if (fallback != s_loggers.end()) {
    return fallback->second;
  }

  // Initialization failed: hand out a logger that drops everything
  static auto null_logger = std::make_shared<spdlog::logger>("null");
  null_logger->set_level(spdlog::level::off);
  return null_logger;
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (!s_initialized) {
    return;
  }

  auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }
}

void LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (!s_initialized) {
    return;
  }

  auto it = s_loggers.find(component);
  if (it != s_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
  } else {
    LOG_WARN("Unknown log component: {}", component);
  }
}

} // namespace util
} // namespace llmmonitor
