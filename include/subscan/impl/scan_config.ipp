#include <subscan/scan_config.hpp>

#include <algorithm>

namespace subscan {

namespace detail {

inline constexpr int quick_concurrency_cap = 20;

}  // namespace detail

inline auto config_for(mode m) -> scan_config {
  using namespace std::chrono_literals;

  scan_config cfg{};
  switch (m) {
    case mode::normal:
      cfg.concurrency = 20;
      cfg.timeout = 5s;
      break;
    case mode::medium:
      cfg.concurrency = 30;
      cfg.timeout = 8s;
      break;
    case mode::ultimate:
      cfg.concurrency = 50;
      cfg.timeout = 10s;
      break;
  }
  return cfg;
}

inline auto quick_config(mode m) -> scan_config {
  auto cfg = config_for(m);
  cfg.concurrency = std::min(cfg.concurrency, detail::quick_concurrency_cap);
  return cfg;
}

inline auto validate(scan_config const& cfg) -> void_result {
  if (cfg.concurrency <= 0) {
    return fail(error::invalid_concurrency);
  }
  if (cfg.timeout <= std::chrono::milliseconds::zero()) {
    return fail(error::invalid_timeout);
  }
  if (cfg.worker_threads < 0 || cfg.max_redirects < 0) {
    return fail(error::invalid_argument);
  }
  return ok();
}

}  // namespace subscan
