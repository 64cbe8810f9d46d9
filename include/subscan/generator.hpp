#pragma once

#include <subscan/domain.hpp>
#include <subscan/mode.hpp>
#include <subscan/scan_result.hpp>
#include <subscan/wordlists.hpp>

#include <cstddef>

namespace subscan {

/// Expands a root domain into subdomain candidates by layered rules.
///
/// Layers (each adds into one set, duplicates merge):
/// 1. canonicalisation: a leading `www.` is stripped first;
/// 2. base labels, every mode;
/// 3. extended dictionary, every mode;
/// 4. mode-specific environment / geographic / numeric expansion;
/// 5. hyphenated word arrangements (medium: pairs, ultimate: pairs and triples).
///
/// `generate()` is deterministic and performs no I/O. Every candidate ends with
/// `.<domain>`; the bare domain is never produced.
class candidate_generator {
 public:
  candidate_generator() = default;
  explicit candidate_generator(wordlists lists) noexcept : lists_(lists) {}

  auto generate(domain const& d, mode m) const -> candidate_set;

  /// Rough cardinality for display (normal 50, medium 150, ultimate 500).
  static auto estimate_count(mode m) noexcept -> std::size_t;

  /// Largest arrangement size of the word-combination layer; 0 disables the layer.
  static auto max_arrangement_size(mode m) noexcept -> std::size_t;

 private:
  wordlists lists_{};
};

/// Shorthand for `candidate_generator{}.generate(d, m)`.
auto generate(domain const& d, mode m) -> candidate_set;

}  // namespace subscan
