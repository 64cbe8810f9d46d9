#pragma once

#include <subscan/error.hpp>
#include <subscan/expected.hpp>

#include <system_error>
#include <variant>

namespace subscan {

/// Common result type for fallible APIs.
template <class T>
using io_result = expected<T, std::error_code>;

/// Result type for void-returning operations.
using void_result = expected<std::monostate, std::error_code>;

[[nodiscard]] inline auto ok() noexcept -> void_result { return std::monostate{}; }
[[nodiscard]] inline auto fail(std::error_code ec) noexcept -> void_result {
  return unexpected(ec);
}

}  // namespace subscan
