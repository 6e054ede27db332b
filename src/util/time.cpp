// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace llmmonitor {
namespace util {

namespace {
std::atomic<int64_t> g_mock_time{0};
}

int64_t GetTime() {
  if (int64_t mock = g_mock_time.load(std::memory_order_relaxed); mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
}

int64_t GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

std::string FormatISO8601(int64_t unix_time) {
  std::time_t t = static_cast<std::time_t>(unix_time);
  std::tm utc{};
  if (gmtime_r(&t, &utc) == nullptr) {
    return "invalid";
  }
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

} // namespace util
} // namespace llmmonitor
