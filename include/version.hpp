// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_VERSION_HPP
#define LLMMONITOR_VERSION_HPP

#include <string>

namespace llmmonitor {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

constexpr const char *COPYRIGHT_YEAR = "2024";
constexpr const char *COPYRIGHT_HOLDERS = "The LLM Monitor developers";

// User-Agent header sent with every HTTP probe
// Format: llmmonitor/0.3.0
inline std::string GetUserAgent() { return "llmmonitor/" + GetVersionString(); }

inline std::string GetFullVersionString() {
  return "LLM Monitor version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *CYAN = "\033[1;36m";
} // namespace colors

// Startup banner printed before the logger takes over stdout
inline std::string GetStartupBanner(size_t range_count, size_t static_hosts) {
  std::string banner;
  banner += "\n";
  banner += colors::CYAN;
  banner += "+-------------------------------------------------------------+\n";
  banner += "|  LLM Monitor - inference host discovery                     |\n";
  banner += "+-------------------------------------------------------------+\n";

  std::string version_line = "|  Version: " + GetVersionString();
  version_line += std::string(62 - version_line.length(), ' ') + "|\n";
  banner += version_line;

  std::string scope_line = "|  Ranges: " + std::to_string(range_count) +
                           "  Static hosts: " + std::to_string(static_hosts);
  if (scope_line.length() < 62) {
    scope_line += std::string(62 - scope_line.length(), ' ');
  }
  banner += scope_line + "|\n";
  banner += "+-------------------------------------------------------------+";
  banner += colors::RESET;
  banner += "\n\n";
  return banner;
}

} // namespace llmmonitor

#endif // LLMMONITOR_VERSION_HPP
