#pragma once

#include <subscan/result.hpp>

#include <compare>
#include <string>
#include <string_view>
#include <utility>

namespace subscan {

/// A validated root domain, e.g. `example.com`.
///
/// Invariants (checked by `parse()`):
/// - lowercase, no scheme prefix, no path suffix;
/// - at least one dot;
/// - matches `^[a-z0-9.-]+\.[a-z]{2,}$`.
///
/// Immutable once constructed.
class domain {
 public:
  /// Normalise user input and validate it.
  ///
  /// Normalisation: trims surrounding whitespace, lowercases, strips an `http://` or
  /// `https://` scheme and anything from the first `/` on. Input that contains inner
  /// whitespace is rejected before normalisation.
  ///
  /// Returns `error::invalid_domain` if the normalised text violates the invariants.
  static auto parse(std::string_view text) -> io_result<domain>;

  /// True iff `text` already satisfies the invariants without normalisation.
  static auto is_valid(std::string_view text) noexcept -> bool;

  auto str() const noexcept -> std::string const& { return name_; }
  auto view() const noexcept -> std::string_view { return name_; }

  /// The domain with one leading `www.` label removed, if what remains is still valid.
  auto without_www() const -> std::string_view;

  friend auto operator==(domain const&, domain const&) -> bool = default;
  friend auto operator<=>(domain const&, domain const&) = default;

 private:
  explicit domain(std::string name) : name_(std::move(name)) {}

  std::string name_;
};

}  // namespace subscan
