#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace subscan {

/// Counting semaphore bounding how many checks are in network I/O at once.
///
/// Semantics:
/// - `acquire()` blocks until a slot is free and returns a `permit` owning it.
/// - The slot is returned when the permit is destroyed or `release()`d, on every exit path.
/// - `acquire(stop_token)` gives up and returns nullopt once stop is requested.
///
/// `in_use()` and `peak()` are observable so callers and tests can check the bound held.
class admission_gate {
 public:
  class permit {
   public:
    permit() noexcept = default;
    permit(permit const&) = delete;
    auto operator=(permit const&) -> permit& = delete;
    permit(permit&& other) noexcept : gate_(std::exchange(other.gate_, nullptr)) {}
    auto operator=(permit&& other) noexcept -> permit& {
      if (this != &other) {
        release();
        gate_ = std::exchange(other.gate_, nullptr);
      }
      return *this;
    }
    ~permit() { release(); }

    void release() noexcept {
      if (auto* g = std::exchange(gate_, nullptr)) {
        g->release_slot();
      }
    }

    explicit operator bool() const noexcept { return gate_ != nullptr; }

   private:
    friend class admission_gate;
    explicit permit(admission_gate* g) noexcept : gate_(g) {}

    admission_gate* gate_ = nullptr;
  };

  explicit admission_gate(std::size_t capacity);

  admission_gate(admission_gate const&) = delete;
  auto operator=(admission_gate const&) -> admission_gate& = delete;

  [[nodiscard]] auto acquire() -> permit;
  [[nodiscard]] auto acquire(std::stop_token stop) -> std::optional<permit>;
  [[nodiscard]] auto try_acquire() -> std::optional<permit>;

  auto capacity() const noexcept -> std::size_t { return capacity_; }
  auto in_use() const -> std::size_t;

  /// Highest `in_use()` ever observed.
  auto peak() const -> std::size_t;

 private:
  void take_slot_locked() noexcept;
  void release_slot() noexcept;

  std::size_t const capacity_;
  mutable std::mutex m_{};
  std::condition_variable_any cv_{};
  std::size_t in_use_ = 0;
  std::size_t peak_ = 0;
};

}  // namespace subscan
