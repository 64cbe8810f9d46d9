#pragma once

#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

#include <version>
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
#include <expected>
#endif

namespace subscan {

// `std::expected` when the standard library has it, otherwise the subset subscan uses.
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L

using std::bad_expected_access;
using std::expected;
using std::unexpected;

#else

template <class E>
class bad_expected_access : public std::exception {
 public:
  explicit bad_expected_access(E e) : err_(std::move(e)) {}

  auto error() const& -> E const& { return err_; }

  const char* what() const noexcept override { return "bad expected access"; }

 private:
  E err_;
};

template <class E>
class unexpected {
 public:
  constexpr explicit unexpected(E const& e) : error_(e) {}
  constexpr explicit unexpected(E&& e) : error_(std::move(e)) {}

  constexpr E const& error() const& noexcept { return error_; }
  constexpr E& error() & noexcept { return error_; }
  constexpr E&& error() && noexcept { return std::move(error_); }

 private:
  E error_;
};

template <class E>
unexpected(E) -> unexpected<E>;

template <class T, class E>
class expected {
  static_assert(!std::is_void_v<T>, "subscan::expected: use void_result for void");

 public:
  using value_type = T;
  using error_type = E;

  constexpr expected() : storage_(std::in_place_index<0>) {}

  constexpr expected(T const& value) : storage_(std::in_place_index<0>, value) {}
  constexpr expected(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}

  template <class G, typename = std::enable_if_t<std::is_convertible_v<G const&, E>>>
  constexpr expected(unexpected<G> const& u) : storage_(std::in_place_index<1>, E(u.error())) {}

  template <class G, typename = std::enable_if_t<std::is_convertible_v<G&&, E>>>
  constexpr expected(unexpected<G>&& u)
      : storage_(std::in_place_index<1>, E(std::move(u).error())) {}

  constexpr bool has_value() const noexcept { return storage_.index() == 0; }
  constexpr explicit operator bool() const noexcept { return has_value(); }

  constexpr T& value() & {
    if (!has_value()) {
      throw bad_expected_access<E>(error());
    }
    return std::get<0>(storage_);
  }

  constexpr T const& value() const& {
    if (!has_value()) {
      throw bad_expected_access<E>(error());
    }
    return std::get<0>(storage_);
  }

  constexpr T&& value() && {
    if (!has_value()) {
      throw bad_expected_access<E>(error());
    }
    return std::move(std::get<0>(storage_));
  }

  constexpr E& error() & noexcept { return std::get<1>(storage_); }
  constexpr E const& error() const& noexcept { return std::get<1>(storage_); }
  constexpr E&& error() && noexcept { return std::move(std::get<1>(storage_)); }

  constexpr T& operator*() & noexcept { return std::get<0>(storage_); }
  constexpr T const& operator*() const& noexcept { return std::get<0>(storage_); }
  constexpr T&& operator*() && noexcept { return std::move(std::get<0>(storage_)); }

  constexpr T* operator->() noexcept { return &std::get<0>(storage_); }
  constexpr T const* operator->() const noexcept { return &std::get<0>(storage_); }

  template <class U>
  constexpr T value_or(U&& default_value) const& {
    return has_value() ? **this : static_cast<T>(std::forward<U>(default_value));
  }

 private:
  std::variant<T, E> storage_;
};

#endif

}  // namespace subscan
