// Copyright (c) 2024 LLM Monitor
// Distributed under the MIT software license

#ifndef LLMMONITOR_UTIL_THREADPOOL_HPP
#define LLMMONITOR_UTIL_THREADPOOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <vector>

namespace llmmonitor {
namespace util {

/**
 * Fixed-size worker pool for blocking calls (reverse DNS lookups) that must
 * not run on an io_context thread.
 *
 * Usage:
 *   ThreadPool pool(2);
 *   auto future = pool.enqueue([](){ return 42; });
 *   int result = future.get();
 */
class ThreadPool {
public:
  // num_threads == 0 uses hardware concurrency
  explicit ThreadPool(size_t num_threads = 0);

  // Drains queued tasks, then joins the workers
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  /**
   * Enqueue a task for execution
   * Returns a future that will contain the result (or the thrown exception)
   * Throws std::runtime_error once the pool is stopping
   */
  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<std::invoke_result_t<F, Args...>>;

  size_t size() const { return workers_.size(); }

  // Number of tasks waiting for a worker
  size_t queued() const;

private:
  void worker_loop();

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  bool stop_{false};
};

template <class F, class... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<std::invoke_result_t<F, Args...>> {
  using return_type = std::invoke_result_t<F, Args...>;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      [fn = std::forward<F>(f),
       bound = std::make_tuple(std::forward<Args>(args)...)]() mutable {
        return std::apply(fn, std::move(bound));
      });

  std::future<return_type> res = task->get_future();
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (stop_) {
      throw std::runtime_error("enqueue on stopped ThreadPool");
    }
    tasks_.emplace([task]() { (*task)(); });
  }
  condition_.notify_one();
  return res;
}

} // namespace util
} // namespace llmmonitor

#endif // LLMMONITOR_UTIL_THREADPOOL_HPP
