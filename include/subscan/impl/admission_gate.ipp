#include <subscan/admission_gate.hpp>

#include <subscan/assert.hpp>

#include <algorithm>

namespace subscan {

inline admission_gate::admission_gate(std::size_t capacity) : capacity_(capacity) {
  SUBSCAN_ENSURE(capacity > 0, "admission_gate: capacity must be > 0");
}

inline auto admission_gate::acquire() -> permit {
  std::unique_lock lk{m_};
  cv_.wait(lk, [this] { return in_use_ < capacity_; });
  take_slot_locked();
  return permit{this};
}

inline auto admission_gate::acquire(std::stop_token stop) -> std::optional<permit> {
  std::unique_lock lk{m_};
  if (!cv_.wait(lk, stop, [this] { return in_use_ < capacity_; })) {
    return std::nullopt;
  }
  take_slot_locked();
  return permit{this};
}

inline auto admission_gate::try_acquire() -> std::optional<permit> {
  std::scoped_lock lk{m_};
  if (in_use_ >= capacity_) {
    return std::nullopt;
  }
  take_slot_locked();
  return permit{this};
}

inline auto admission_gate::in_use() const -> std::size_t {
  std::scoped_lock lk{m_};
  return in_use_;
}

inline auto admission_gate::peak() const -> std::size_t {
  std::scoped_lock lk{m_};
  return peak_;
}

inline void admission_gate::take_slot_locked() noexcept {
  ++in_use_;
  peak_ = std::max(peak_, in_use_);
  SUBSCAN_ASSERT(in_use_ <= capacity_);
}

inline void admission_gate::release_slot() noexcept {
  {
    std::scoped_lock lk{m_};
    SUBSCAN_ASSERT(in_use_ > 0, "admission_gate: release without acquire");
    --in_use_;
  }
  cv_.notify_one();
}

}  // namespace subscan
