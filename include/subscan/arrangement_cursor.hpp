#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace subscan {

/// Walks every ordered arrangement (k-permutation) of every k-subset of a vocabulary,
/// for k in [min_size, max_size], without materialising them.
///
/// Order: by size, then by combination (lexicographic over vocabulary indices), then by
/// permutation (lexicographic). Memory is O(max_size). One-shot: not restartable.
///
/// `max_size` is clamped to the vocabulary size; a size range that is empty after
/// clamping (or `min_size == 0` with an empty vocabulary) yields nothing.
class arrangement_cursor {
 public:
  arrangement_cursor(std::span<std::string_view const> vocabulary, std::size_t min_size,
                     std::size_t max_size) noexcept;

  /// Advance to the next arrangement. Returns false once exhausted.
  auto next() -> bool;

  /// Words of the current arrangement. Only valid after `next()` returned true.
  auto current() const -> std::vector<std::string_view>;

  /// Current arrangement joined with `sep`, e.g. `api-web-dev`.
  auto joined(char sep) const -> std::string;

  /// Number of arrangements a cursor over `n` words would yield: sum of nPk.
  static auto count(std::size_t n, std::size_t min_size, std::size_t max_size) noexcept
    -> std::size_t;

 private:
  void reset_for_size(std::size_t k);
  auto advance_combination() -> bool;

  std::span<std::string_view const> vocab_;
  std::size_t min_size_;
  std::size_t max_size_;
  std::size_t size_ = 0;
  bool started_ = false;
  bool done_ = false;

  std::vector<std::size_t> combination_{};
  std::vector<std::size_t> permutation_{};
};

}  // namespace subscan
