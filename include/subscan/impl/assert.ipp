#include <subscan/assert.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>

namespace subscan::detail {

[[noreturn]] inline void fail_impl(char const* kind, char const* expr, char const* msg,
                                   char const* file, int line, char const* func) noexcept {
  if (msg) {
    fmt::print(stderr,
               "[subscan] {} failure\n"
               "  expression: {}\n"
               "  message   : {}\n"
               "  location  : {}:{}\n"
               "  function  : {}\n",
               kind, expr ? expr : "(none)", msg, file, line, func);
  } else {
    fmt::print(stderr,
               "[subscan] {} failure\n"
               "  expression: {}\n"
               "  location  : {}:{}\n"
               "  function  : {}\n",
               kind, expr ? expr : "(none)", file, line, func);
  }
  std::fflush(stderr);
  std::abort();
}

inline void assert_fail(char const* expr, char const* file, int line, char const* func) noexcept {
  fail_impl("ASSERT", expr, nullptr, file, line, func);
}

inline void assert_fail(char const* expr, char const* msg, char const* file, int line,
                        char const* func) noexcept {
  fail_impl("ASSERT", expr, msg, file, line, func);
}

inline void ensure_fail(char const* expr, char const* file, int line, char const* func) noexcept {
  fail_impl("ENSURE", expr, nullptr, file, line, func);
}

inline void ensure_fail(char const* expr, char const* msg, char const* file, int line,
                        char const* func) noexcept {
  fail_impl("ENSURE", expr, msg, file, line, func);
}

inline void unreachable_fail(char const* file, int line, char const* func) noexcept {
  fail_impl("UNREACHABLE", nullptr, nullptr, file, line, func);
}

}  // namespace subscan::detail
