#include <gtest/gtest.h>

#include <subscan/thread_pool.hpp>
#include <subscan/impl.hpp>

#include "test_util.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <cstdlib>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unordered_set>

namespace {

using namespace std::chrono_literals;

TEST(thread_pool, post_runs_on_multiple_threads) {
  subscan::thread_pool pool{4};
  EXPECT_EQ(pool.size(), 4u);

  std::mutex m;
  std::unordered_set<std::thread::id> threads;
  std::atomic<int> done{0};

  for (int i = 0; i < 200; ++i) {
    pool.post([&] {
      {
        std::scoped_lock lk{m};
        threads.insert(std::this_thread::get_id());
      }
      std::this_thread::sleep_for(100us);
      done.fetch_add(1, std::memory_order_relaxed);
    });
  }
  pool.join();

  EXPECT_EQ(done.load(), 200);
  EXPECT_GT(threads.size(), 1u);
}

TEST(thread_pool, join_drains_queue) {
  subscan::thread_pool pool{1};
  std::atomic<int> done{0};
  for (int i = 0; i < 50; ++i) {
    pool.post([&] { done.fetch_add(1); });
  }
  pool.join();
  EXPECT_EQ(done.load(), 50);
  EXPECT_EQ(pool.pending(), 0u);

  pool.join();
  pool.stop();
}

TEST(thread_pool, stop_drops_queued_tasks) {
  subscan::thread_pool pool{1};
  std::atomic<bool> started{false};
  std::atomic<bool> release{false};
  std::atomic<int> done{0};

  pool.post([&] {
    started.store(true);
    while (!release.load()) {
      std::this_thread::sleep_for(1ms);
    }
    done.fetch_add(1);
  });
  for (int i = 0; i < 10; ++i) {
    pool.post([&] { done.fetch_add(1); });
  }

  while (!started.load()) {
    std::this_thread::sleep_for(1ms);
  }

  std::thread releaser([&] {
    std::this_thread::sleep_for(20ms);
    release.store(true);
  });
  pool.stop();
  releaser.join();

  EXPECT_EQ(done.load(), 1);
}

TEST(thread_pool, throwing_task_does_not_kill_worker) {
  subscan::thread_pool pool{1};
  std::atomic<int> done{0};
  pool.post([] { throw std::runtime_error{"boom"}; });
  pool.post([&] { done.fetch_add(1); });
  pool.join();
  EXPECT_EQ(done.load(), 1);
}

TEST(thread_pool, task_throwing_non_standard_value_does_not_kill_worker) {
  subscan::thread_pool pool{1};
  std::atomic<int> done{0};
  pool.post([] { throw 42; });
  pool.post([&] { done.fetch_add(1); });
  pool.join();
  EXPECT_EQ(done.load(), 1);
}

TEST(thread_pool, failed_thread_start_throws_after_joining_started_workers) {
  EXPECT_EXIT(
    {
      if (!subscan::cap_address_space(std::size_t{64} << 20)) {
        std::_Exit(2);
      }
      try {
        subscan::thread_pool pool{256};
      } catch (std::system_error const&) {
        std::_Exit(0);
      }
      std::_Exit(3);
    },
    ::testing::ExitedWithCode(0), "");
}

}  // namespace
