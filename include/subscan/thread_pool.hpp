#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace subscan {

/// A fixed set of worker threads draining one FIFO task queue.
///
/// Design:
/// - `post()` may be called from any thread until `join()`/`stop()`.
/// - `join()` lets the workers finish everything already queued, then joins them.
/// - `stop()` discards queued tasks; running tasks finish normally.
///
/// A task that throws is logged and dropped; the worker keeps going.
class thread_pool {
 public:
  /// Throws `std::system_error` if a worker cannot be started; workers already
  /// running are joined first.
  explicit thread_pool(std::size_t n_threads);

  thread_pool(thread_pool const&) = delete;
  auto operator=(thread_pool const&) -> thread_pool& = delete;
  thread_pool(thread_pool&&) = delete;
  auto operator=(thread_pool&&) -> thread_pool& = delete;

  ~thread_pool();

  void post(std::function<void()> f);

  /// Drain the queue and join all workers (idempotent).
  void join() noexcept;

  /// Drop queued tasks and join all workers (idempotent).
  void stop() noexcept;

  auto size() const noexcept -> std::size_t { return threads_.size(); }

  /// Tasks posted but not yet picked up by a worker.
  auto pending() const -> std::size_t;

 private:
  void worker_loop();
  void join_threads() noexcept;

  mutable std::mutex m_{};
  std::condition_variable cv_{};
  std::queue<std::function<void()>> queue_{};
  bool draining_ = false;
  bool stopped_ = false;

  std::vector<std::thread> threads_{};
};

}  // namespace subscan
