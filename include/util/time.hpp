// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_UTIL_TIME_HPP
#define LLMMONITOR_UTIL_TIME_HPP

#include <cstdint>
#include <string>

namespace llmmonitor {
namespace util {

/**
 * Wall clock used for host last-seen stamps and cache update times
 *
 * Unix seconds. While a mock time is set (non-zero) GetTime() returns it, so
 * tests get deterministic timestamps and JSON output.
 */
int64_t GetTime();

// 0 switches back to the system clock
void SetMockTime(int64_t time);
int64_t GetMockTime();

// "2024-05-01T12:00:00Z"
std::string FormatISO8601(int64_t unix_time);

// Sets a mock time for the lifetime of the scope
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) {
    SetMockTime(time);
  }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;

private:
  int64_t previous_;
};

} // namespace util
} // namespace llmmonitor

#endif // LLMMONITOR_UTIL_TIME_HPP
