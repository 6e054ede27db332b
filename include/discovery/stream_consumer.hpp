// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_DISCOVERY_STREAM_CONSUMER_HPP
#define LLMMONITOR_DISCOVERY_STREAM_CONSUMER_HPP

#include "discovery/discovery_channel.hpp"
#include "discovery/host_registry.hpp"
#include <atomic>
#include <chrono>
#include <thread>

namespace llmmonitor {
namespace discovery {

/**
 * StreamConsumer - merges discovery events into the registry as they arrive
 *
 * Runs on its own thread. Each event is merged (registry and capability view
 * together) and then retired on the channel with TaskDone(), which is what
 * lets the drain barrier complete. A failed merge is logged and still
 * retired.
 */
class StreamConsumer {
public:
  static constexpr std::chrono::milliseconds POP_WAIT{1000};

  StreamConsumer(DiscoveryChannel &channel, HostRegistry &registry);
  ~StreamConsumer();

  StreamConsumer(const StreamConsumer &) = delete;
  StreamConsumer &operator=(const StreamConsumer &) = delete;

  void Start();

  // Returns once the thread has exited; idempotent
  void Stop();

  bool IsRunning() const { return running_.load(); }
  uint64_t Processed() const { return processed_.load(); }

private:
  void Run();

  DiscoveryChannel &channel_;
  HostRegistry &registry_;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> processed_{0};
  std::thread thread_;
};

} // namespace discovery
} // namespace llmmonitor

#endif // LLMMONITOR_DISCOVERY_STREAM_CONSUMER_HPP
