// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_POLLING_ADAPTIVE_POLL_CONTROLLER_HPP
#define LLMMONITOR_POLLING_ADAPTIVE_POLL_CONTROLLER_HPP

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace llmmonitor {
namespace polling {

struct PollConfig {
  std::chrono::seconds window{5}; // length of one cycle
  size_t tick_threshold{4};       // ticks in one window that force a refresh
  size_t max_cycles{12};          // idle windows before a forced refresh

  // Throws std::invalid_argument
  void Validate() const;
};

using RefreshCallback = std::function<void()>;

/**
 * AdaptivePollController - refresh downstream data as fast as clients ask
 * for it, and no slower than window * max_cycles
 *
 * Tick() counts client activity. tick_threshold ticks inside one window
 * refresh immediately. Every window the cycle counter advances and the tick
 * counter starts over; after max_cycles windows without a refresh one is
 * forced. Any refresh resets both counters.
 *
 * The window timer runs on the controller's own io_context thread. The
 * refresh callback runs with the counter lock held, so refreshes never
 * overlap. Callback exceptions are logged, never propagated.
 */
class AdaptivePollController {
public:
  explicit AdaptivePollController(PollConfig config = {});
  ~AdaptivePollController();

  AdaptivePollController(const AdaptivePollController &) = delete;
  AdaptivePollController &operator=(const AdaptivePollController &) = delete;

  /**
   * Install the callback and start the window timer
   * With run_timer == false no thread is started and windows only advance
   * through OnWindowElapsed() (tests).
   * Returns false if already started or stopped.
   */
  bool Start(RefreshCallback callback, bool run_timer = true);

  // Cancels the timer and joins its thread; later ticks are ignored
  void Stop();

  void Tick();

  // One window boundary, normally driven by the timer
  void OnWindowElapsed();

  bool IsRunning() const { return running_.load(); }
  size_t TickCount() const;
  size_t CycleCount() const;
  uint64_t RefreshCount() const { return refresh_count_.load(); }
  const PollConfig &GetConfig() const { return config_; }

private:
  void ScheduleWindow();
  void TriggerRefreshLocked();

  const PollConfig config_;

  boost::asio::io_context io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  boost::asio::steady_timer window_timer_;
  std::thread io_thread_;

  mutable std::mutex mutex_;
  size_t tick_count_{0};
  size_t cycle_count_{0};
  RefreshCallback callback_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<uint64_t> refresh_count_{0};
};

} // namespace polling
} // namespace llmmonitor

#endif // LLMMONITOR_POLLING_ADAPTIVE_POLL_CONTROLLER_HPP
