#include <subscan/log.hpp>

#include <subscan/detail/ascii.hpp>

#include <atomic>
#include <cstdio>
#include <exception>
#include <mutex>
#include <string>

namespace subscan {

namespace detail {

inline std::atomic<log_level> g_level{log_level::warn};
inline std::mutex g_write_mtx;

}  // namespace detail

inline auto to_string(log_level level) noexcept -> std::string_view {
  switch (level) {
    case log_level::trace:
      return "trace";
    case log_level::debug:
      return "debug";
    case log_level::info:
      return "info";
    case log_level::warn:
      return "warn";
    case log_level::error:
      return "error";
    case log_level::off:
      return "off";
  }
  return "unknown";
}

inline auto parse_log_level(std::string_view text) -> std::optional<log_level> {
  auto const lowered = detail::to_lower_ascii(text);

  for (auto level : {log_level::trace, log_level::debug, log_level::info, log_level::warn,
                     log_level::error, log_level::off}) {
    if (lowered == to_string(level)) {
      return level;
    }
  }
  if (lowered == "warning") {
    return log_level::warn;
  }
  return std::nullopt;
}

inline void set_log_level(log_level level) noexcept {
  detail::g_level.store(level, std::memory_order_relaxed);
}

inline auto get_log_level() noexcept -> log_level {
  return detail::g_level.load(std::memory_order_relaxed);
}

namespace detail {

inline void log_write(log_level level, std::string_view msg) noexcept {
  std::scoped_lock lk{g_write_mtx};
  try {
    fmt::print(stderr, "[subscan] {}: {}\n", to_string(level), msg);
  } catch (std::exception const&) {
    // stderr is gone; nowhere left to report.
  }
}

}  // namespace detail

}  // namespace subscan
