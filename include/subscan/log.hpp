#pragma once

#include <fmt/format.h>

#include <optional>
#include <string_view>
#include <utility>

namespace subscan {

enum class log_level {
  trace,
  debug,
  info,
  warn,
  error,
  off,
};

auto to_string(log_level level) noexcept -> std::string_view;
auto parse_log_level(std::string_view text) -> std::optional<log_level>;

/// Process-wide threshold. Messages below it are dropped before formatting.
void set_log_level(log_level level) noexcept;
auto get_log_level() noexcept -> log_level;

namespace detail {

/// Writes one `[subscan] <level>: <msg>` line to stderr. Serialised across threads.
void log_write(log_level level, std::string_view msg) noexcept;

}  // namespace detail

template <class... Args>
void log(log_level level, fmt::format_string<Args...> f, Args&&... args) {
  if (level < get_log_level() || level == log_level::off) {
    return;
  }
  detail::log_write(level, fmt::format(f, std::forward<Args>(args)...));
}

template <class... Args>
void log_trace(fmt::format_string<Args...> f, Args&&... args) {
  log(log_level::trace, f, std::forward<Args>(args)...);
}

template <class... Args>
void log_debug(fmt::format_string<Args...> f, Args&&... args) {
  log(log_level::debug, f, std::forward<Args>(args)...);
}

template <class... Args>
void log_info(fmt::format_string<Args...> f, Args&&... args) {
  log(log_level::info, f, std::forward<Args>(args)...);
}

template <class... Args>
void log_warn(fmt::format_string<Args...> f, Args&&... args) {
  log(log_level::warn, f, std::forward<Args>(args)...);
}

template <class... Args>
void log_error(fmt::format_string<Args...> f, Args&&... args) {
  log(log_level::error, f, std::forward<Args>(args)...);
}

}  // namespace subscan
