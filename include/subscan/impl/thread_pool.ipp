#include <subscan/thread_pool.hpp>

#include <subscan/assert.hpp>
#include <subscan/log.hpp>

#include <exception>
#include <utility>

namespace subscan {

inline thread_pool::thread_pool(std::size_t n_threads) {
  SUBSCAN_ENSURE(n_threads > 0, "thread_pool: n_threads must be > 0");

  threads_.reserve(n_threads);
  try {
    for (std::size_t i = 0; i < n_threads; ++i) {
      threads_.emplace_back([this] { worker_loop(); });
    }
  } catch (...) {
    // Workers already started must be joined before threads_ goes away.
    stop();
    throw;
  }
}

inline thread_pool::~thread_pool() { stop(); }

inline void thread_pool::post(std::function<void()> f) {
  {
    std::scoped_lock lk{m_};
    SUBSCAN_ENSURE(!draining_ && !stopped_, "thread_pool: post() after join()/stop()");
    queue_.push(std::move(f));
  }
  cv_.notify_one();
}

inline void thread_pool::join() noexcept {
  {
    std::scoped_lock lk{m_};
    draining_ = true;
  }
  cv_.notify_all();
  join_threads();
}

inline void thread_pool::stop() noexcept {
  std::queue<std::function<void()>> dropped{};
  {
    std::scoped_lock lk{m_};
    stopped_ = true;
    std::swap(dropped, queue_);
  }
  cv_.notify_all();
  join_threads();
}

inline auto thread_pool::pending() const -> std::size_t {
  std::scoped_lock lk{m_};
  return queue_.size();
}

inline void thread_pool::worker_loop() {
  for (;;) {
    std::function<void()> task{};
    {
      std::unique_lock lk{m_};
      cv_.wait(lk, [this] { return stopped_ || draining_ || !queue_.empty(); });
      if (stopped_) {
        return;
      }
      if (queue_.empty()) {
        // draining_ with nothing left.
        return;
      }
      task = std::move(queue_.front());
      queue_.pop();
    }

    try {
      task();
    } catch (std::exception const& e) {
      log_error("thread_pool: task threw: {}", e.what());
    } catch (...) {
      log_error("thread_pool: task threw: unknown exception");
    }
  }
}

inline void thread_pool::join_threads() noexcept {
  for (auto& t : threads_) {
    if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
      t.join();
    }
  }
}

}  // namespace subscan
