#include <gtest/gtest.h>

#include <subscan/admission_gate.hpp>
#include <subscan/impl.hpp>

#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

TEST(admission_gate_test, permits_are_counted_and_returned) {
  subscan::admission_gate gate{2};
  EXPECT_EQ(gate.capacity(), 2u);
  {
    auto a = gate.acquire();
    auto b = gate.acquire();
    EXPECT_TRUE(a);
    EXPECT_TRUE(b);
    EXPECT_EQ(gate.in_use(), 2u);
    EXPECT_FALSE(gate.try_acquire().has_value());
  }
  EXPECT_EQ(gate.in_use(), 0u);
  EXPECT_EQ(gate.peak(), 2u);
}

TEST(admission_gate_test, release_and_move) {
  subscan::admission_gate gate{1};
  auto a = gate.acquire();
  auto b = std::move(a);
  EXPECT_FALSE(a);
  EXPECT_TRUE(b);
  EXPECT_EQ(gate.in_use(), 1u);

  b.release();
  EXPECT_FALSE(b);
  EXPECT_EQ(gate.in_use(), 0u);

  b.release();
  EXPECT_EQ(gate.in_use(), 0u);
}

TEST(admission_gate_test, acquire_blocks_until_a_permit_is_released) {
  subscan::admission_gate gate{1};
  auto held = gate.acquire();

  std::atomic<bool> acquired{false};
  std::thread t([&] {
    auto p = gate.acquire();
    acquired.store(true);
  });

  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(acquired.load());

  held.release();
  t.join();
  EXPECT_TRUE(acquired.load());
  EXPECT_EQ(gate.in_use(), 0u);
}

TEST(admission_gate_test, acquire_gives_up_on_stop) {
  subscan::admission_gate gate{1};
  auto held = gate.acquire();

  std::stop_source stop{};
  std::thread t([&] {
    auto p = gate.acquire(stop.get_token());
    EXPECT_FALSE(p.has_value());
  });

  std::this_thread::sleep_for(20ms);
  stop.request_stop();
  t.join();
  EXPECT_EQ(gate.in_use(), 1u);
}

TEST(admission_gate_test, bound_holds_under_contention) {
  constexpr std::size_t capacity = 3;
  subscan::admission_gate gate{capacity};
  std::atomic<std::size_t> inside{0};
  std::atomic<std::size_t> worst{0};

  std::vector<std::thread> threads{};
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&] {
      for (int j = 0; j < 20; ++j) {
        auto p = gate.acquire();
        auto now = inside.fetch_add(1) + 1;
        auto seen = worst.load();
        while (now > seen && !worst.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(100us);
        inside.fetch_sub(1);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_LE(worst.load(), capacity);
  EXPECT_LE(gate.peak(), capacity);
  EXPECT_EQ(gate.in_use(), 0u);
}

}  // namespace
