#pragma once

#include <cstdlib>
#include <exception>

#if defined(__GNUC__) || defined(__clang__)
#define SUBSCAN_LIKELY(x) __builtin_expect(!!(x), 1)
#define SUBSCAN_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define SUBSCAN_LIKELY(x) (x)
#define SUBSCAN_UNLIKELY(x) (x)
#endif

namespace subscan::detail {

[[noreturn]] void assert_fail(char const* expr, char const* file, int line,
                              char const* func) noexcept;

[[noreturn]] void assert_fail(char const* expr, char const* msg, char const* file, int line,
                              char const* func) noexcept;

[[noreturn]] void ensure_fail(char const* expr, char const* file, int line,
                              char const* func) noexcept;

[[noreturn]] void ensure_fail(char const* expr, char const* msg, char const* file, int line,
                              char const* func) noexcept;

[[noreturn]] void unreachable_fail(char const* file, int line, char const* func) noexcept;

}  // namespace subscan::detail

// -------------------- ASSERT --------------------
// Debug-only internal invariants.
#if !defined(NDEBUG)

#define SUBSCAN_ASSERT_SELECTOR(_1, _2, NAME, ...) NAME

#define SUBSCAN_ASSERT_1(expr)                    \
  (SUBSCAN_LIKELY(expr) ? (void)0                 \
                        : ::subscan::detail::assert_fail(#expr, __FILE__, __LINE__, __func__))

#define SUBSCAN_ASSERT_2(expr, msg)               \
  (SUBSCAN_LIKELY(expr) ? (void)0                 \
                        : ::subscan::detail::assert_fail(#expr, msg, __FILE__, __LINE__, __func__))

#define SUBSCAN_ASSERT(...) \
  SUBSCAN_ASSERT_SELECTOR(__VA_ARGS__, SUBSCAN_ASSERT_2, SUBSCAN_ASSERT_1)(__VA_ARGS__)

#else
#define SUBSCAN_ASSERT(...) ((void)0)
#endif

// -------------------- ENSURE --------------------
// Always-on precondition checks (API misuse).

#define SUBSCAN_ENSURE_SELECTOR(_1, _2, NAME, ...) NAME

#define SUBSCAN_ENSURE_1(expr)                    \
  (SUBSCAN_LIKELY(expr) ? (void)0                 \
                        : ::subscan::detail::ensure_fail(#expr, __FILE__, __LINE__, __func__))

#define SUBSCAN_ENSURE_2(expr, msg)               \
  (SUBSCAN_LIKELY(expr) ? (void)0                 \
                        : ::subscan::detail::ensure_fail(#expr, msg, __FILE__, __LINE__, __func__))

#define SUBSCAN_ENSURE(...) \
  SUBSCAN_ENSURE_SELECTOR(__VA_ARGS__, SUBSCAN_ENSURE_2, SUBSCAN_ENSURE_1)(__VA_ARGS__)

// -------------------- UNREACHABLE --------------------

#define SUBSCAN_UNREACHABLE() ::subscan::detail::unreachable_fail(__FILE__, __LINE__, __func__)
