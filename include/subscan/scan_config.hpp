#pragma once

#include <subscan/mode.hpp>
#include <subscan/result.hpp>

#include <chrono>
#include <string>

namespace subscan {

inline constexpr char default_user_agent[] =
  "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36";

/// Verifier tuning. A value type: the verifier reads it and never mutates it.
struct scan_config {
  /// Maximum number of candidates in DNS/HTTPS I/O at once. Must be > 0.
  int concurrency = 20;

  /// Bound for each DNS lookup and for the HTTPS probe of one candidate. Must be > 0.
  std::chrono::milliseconds timeout{5000};

  /// Worker threads executing checks. 0 means "same as concurrency".
  int worker_threads = 0;

  std::string user_agent = default_user_agent;

  /// Redirect hops followed by the HTTPS probe.
  int max_redirects = 10;
};

/// Policy defaults: normal 20/5s, medium 30/8s, ultimate 50/10s.
auto config_for(mode m) -> scan_config;

/// Same as `config_for()` with concurrency capped at 20, for fast interactive runs.
auto quick_config(mode m) -> scan_config;

/// Rejects non-positive concurrency/timeout and negative worker/redirect counts.
auto validate(scan_config const& cfg) -> void_result;

}  // namespace subscan
