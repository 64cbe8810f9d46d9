#include <subscan/arrangement_cursor.hpp>

#include <subscan/assert.hpp>

#include <algorithm>
#include <numeric>

namespace subscan {

inline arrangement_cursor::arrangement_cursor(std::span<std::string_view const> vocabulary,
                                              std::size_t min_size, std::size_t max_size) noexcept
    : vocab_(vocabulary),
      min_size_(std::max<std::size_t>(min_size, 1)),
      max_size_(std::min(max_size, vocabulary.size())) {
  if (min_size_ > max_size_) {
    done_ = true;
  }
}

inline auto arrangement_cursor::next() -> bool {
  if (done_) {
    return false;
  }

  if (!started_) {
    started_ = true;
    reset_for_size(min_size_);
    return true;
  }

  // permutation_ starts sorted, so next_permutation visits all k! orders exactly once.
  if (std::next_permutation(permutation_.begin(), permutation_.end())) {
    return true;
  }

  if (advance_combination()) {
    return true;
  }

  if (size_ + 1 > max_size_) {
    done_ = true;
    return false;
  }
  reset_for_size(size_ + 1);
  return true;
}

inline auto arrangement_cursor::current() const -> std::vector<std::string_view> {
  SUBSCAN_ASSERT(started_ && !done_, "arrangement_cursor: no current arrangement");

  std::vector<std::string_view> out{};
  out.reserve(permutation_.size());
  for (auto i : permutation_) {
    out.push_back(vocab_[i]);
  }
  return out;
}

inline auto arrangement_cursor::joined(char sep) const -> std::string {
  SUBSCAN_ASSERT(started_ && !done_, "arrangement_cursor: no current arrangement");

  std::string out{};
  for (std::size_t i = 0; i < permutation_.size(); ++i) {
    if (i != 0) {
      out.push_back(sep);
    }
    out.append(vocab_[permutation_[i]]);
  }
  return out;
}

inline auto arrangement_cursor::count(std::size_t n, std::size_t min_size,
                                      std::size_t max_size) noexcept -> std::size_t {
  min_size = std::max<std::size_t>(min_size, 1);
  max_size = std::min(max_size, n);

  std::size_t total = 0;
  for (std::size_t k = min_size; k <= max_size; ++k) {
    std::size_t npk = 1;
    for (std::size_t i = 0; i < k; ++i) {
      npk *= n - i;
    }
    total += npk;
  }
  return total;
}

inline void arrangement_cursor::reset_for_size(std::size_t k) {
  size_ = k;
  combination_.resize(k);
  std::iota(combination_.begin(), combination_.end(), std::size_t{0});
  permutation_ = combination_;
}

inline auto arrangement_cursor::advance_combination() -> bool {
  auto const n = vocab_.size();
  auto const k = size_;

  // Rightmost index that can still move right.
  for (std::size_t j = k; j-- > 0;) {
    if (combination_[j] < n - k + j) {
      ++combination_[j];
      for (std::size_t m = j + 1; m < k; ++m) {
        combination_[m] = combination_[m - 1] + 1;
      }
      permutation_ = combination_;
      return true;
    }
  }
  return false;
}

}  // namespace subscan
