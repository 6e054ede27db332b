// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#include "util/threadpool.hpp"

namespace llmmonitor {
namespace util {

ThreadPool::ThreadPool(size_t num_threads) {
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) {
      num_threads = 4;
    }
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
}

ThreadPool::~ThreadPool() {
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    stop_ = true;
  }
  condition_.notify_all();

  for (std::thread &worker : workers_) {
    worker.join();
  }
}

size_t ThreadPool::queued() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return tasks_.size();
}

void ThreadPool::worker_loop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

      if (stop_ && tasks_.empty()) {
        return;
      }

      task = std::move(tasks_.front());
      tasks_.pop();
    }

    // packaged_task stores any exception in its future
    task();
  }
}

} // namespace util
} // namespace llmmonitor
