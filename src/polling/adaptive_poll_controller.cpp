// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "polling/adaptive_poll_controller.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace llmmonitor {
namespace polling {

void PollConfig::Validate() const {
  if (window < std::chrono::seconds(1)) {
    throw std::invalid_argument("poll window must be at least 1 second");
  }
  if (tick_threshold < 1) {
    throw std::invalid_argument("tick threshold must be at least 1");
  }
  if (max_cycles < 1) {
    throw std::invalid_argument("max cycles must be at least 1");
  }
}

AdaptivePollController::AdaptivePollController(PollConfig config)
    : config_(config), window_timer_(io_context_) {
  config_.Validate();
  LOG_POLL_INFO("AdaptivePollController initialized: window={}s, threshold={} "
                "ticks, max_cycles={} ({}s max delay)",
                config_.window.count(), config_.tick_threshold,
                config_.max_cycles,
                config_.window.count() *
                    static_cast<int64_t>(config_.max_cycles));
}

AdaptivePollController::~AdaptivePollController() { Stop(); }

bool AdaptivePollController::Start(RefreshCallback callback, bool run_timer) {
  if (stopped_.load() || running_.load()) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
  }
  running_.store(true);

  if (run_timer) {
    work_guard_ = std::make_unique<boost::asio::executor_work_guard<
        boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(io_context_));
    ScheduleWindow();
    io_thread_ = std::thread([this]() { io_context_.run(); });
  }

  LOG_POLL_INFO("AdaptivePollController started");
  return true;
}

void AdaptivePollController::Stop() {
  if (stopped_.exchange(true)) {
    return;
  }
  running_.store(false);

  io_context_.stop();
  work_guard_.reset();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  LOG_POLL_INFO("AdaptivePollController stopped");
}

void AdaptivePollController::ScheduleWindow() {
  window_timer_.expires_after(config_.window);
  window_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted || !running_.load()) {
      return;
    }
    OnWindowElapsed();
    ScheduleWindow();
  });
}

void AdaptivePollController::Tick() {
  if (!running_.load()) {
    LOG_POLL_DEBUG("Tick ignored: controller not running");
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  ++tick_count_;
  LOG_POLL_DEBUG("Tick received. Count: {}/{}", tick_count_,
                 config_.tick_threshold);

  if (tick_count_ >= config_.tick_threshold) {
    LOG_POLL_INFO("Tick threshold reached ({} >= {}), triggering refresh",
                  tick_count_, config_.tick_threshold);
    TriggerRefreshLocked();
  }
}

void AdaptivePollController::OnWindowElapsed() {
  if (!running_.load()) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  ++cycle_count_;
  LOG_POLL_DEBUG("Cycle {}/{}, ticks in window: {}", cycle_count_,
                 config_.max_cycles, tick_count_);

  if (cycle_count_ >= config_.max_cycles) {
    LOG_POLL_INFO("Max cycles reached ({}), forcing refresh", cycle_count_);
    TriggerRefreshLocked();
    return;
  }
  tick_count_ = 0;
}

void AdaptivePollController::TriggerRefreshLocked() {
  if (callback_) {
    try {
      callback_();
      LOG_POLL_INFO("Refresh triggered successfully");
    } catch (const std::exception &e) {
      LOG_POLL_ERROR("Error during refresh: {}", e.what());
    }
  } else {
    LOG_POLL_WARN("Refresh triggered but no callback registered");
  }

  ++refresh_count_;
  tick_count_ = 0;
  cycle_count_ = 0;
  LOG_POLL_DEBUG("Counters reset");
}

size_t AdaptivePollController::TickCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tick_count_;
}

size_t AdaptivePollController::CycleCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cycle_count_;
}

} // namespace polling
} // namespace llmmonitor
