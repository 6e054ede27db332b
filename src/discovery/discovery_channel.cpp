// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "discovery/discovery_channel.hpp"
#include "util/logging.hpp"

namespace llmmonitor {
namespace discovery {

bool DiscoveryChannel::Push(DiscoveryEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    queue_.push_back(std::move(event));
    ++unfinished_;
  }
  not_empty_.notify_one();
  return true;
}

std::optional<DiscoveryEvent>
DiscoveryChannel::Pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!not_empty_.wait_for(lock, timeout,
                           [this] { return closed_ || !queue_.empty(); })) {
    return std::nullopt;
  }
  if (closed_ || queue_.empty()) {
    return std::nullopt;
  }
  DiscoveryEvent event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

void DiscoveryChannel::TaskDone() {
  bool drained = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unfinished_ == 0) {
      LOG_DISC_WARN("DiscoveryChannel::TaskDone called more times than Push");
      return;
    }
    drained = (--unfinished_ == 0);
  }
  if (drained) {
    all_done_.notify_all();
  }
}

bool DiscoveryChannel::Join() {
  std::unique_lock<std::mutex> lock(mutex_);
  all_done_.wait(lock, [this] { return closed_ || unfinished_ == 0; });
  return unfinished_ == 0 && !closed_;
}

void DiscoveryChannel::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  all_done_.notify_all();
}

bool DiscoveryChannel::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t DiscoveryChannel::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

size_t DiscoveryChannel::Unfinished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return unfinished_;
}

} // namespace discovery
} // namespace llmmonitor
