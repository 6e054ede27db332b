// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_DISCOVERY_CHANNEL_HPP
#define LLMMONITOR_DISCOVERY_CHANNEL_HPP

#include "discovery/host.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace llmmonitor {
namespace discovery {

/**
 * DiscoveryChannel - unbounded FIFO between probes and the stream consumer
 *
 * Tracks unfinished work like a task queue: Push() adds one unit, TaskDone()
 * retires one after the consumer has merged the event. Join() is the drain
 * barrier: it returns once every pushed event has been retired.
 *
 * Close() wakes every waiter; afterwards Push() is rejected, Pop() returns
 * nothing and Join() returns false.
 */
class DiscoveryChannel {
public:
  DiscoveryChannel() = default;
  DiscoveryChannel(const DiscoveryChannel &) = delete;
  DiscoveryChannel &operator=(const DiscoveryChannel &) = delete;

  // false once closed
  bool Push(DiscoveryEvent event);

  // Waits up to timeout for an event
  std::optional<DiscoveryEvent> Pop(std::chrono::milliseconds timeout);

  void TaskDone();

  // true when drained, false when the channel was closed while waiting
  bool Join();

  void Close();

  bool IsClosed() const;
  size_t Size() const;
  size_t Unfinished() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable all_done_;
  std::deque<DiscoveryEvent> queue_;
  size_t unfinished_{0};
  bool closed_{false};
};

} // namespace discovery
} // namespace llmmonitor

#endif // LLMMONITOR_DISCOVERY_CHANNEL_HPP
