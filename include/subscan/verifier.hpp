#pragma once

#include <subscan/probe.hpp>
#include <subscan/result.hpp>
#include <subscan/scan_config.hpp>
#include <subscan/scan_result.hpp>

#include <memory>
#include <stop_token>
#include <string>

namespace subscan {

/// Checks candidates against live DNS and HTTPS under a concurrency bound.
///
/// Per candidate:
/// 1. A lookup, falling back to a CNAME lookup; either success means "resolved".
/// 2. Only for resolved names: HTTPS HEAD; a final status below 400 means "alive".
///
/// Failures of a single candidate (error codes or exceptions thrown by a probe) only
/// keep it out of the result sets; they never fail the scan. At most
/// `cfg.concurrency` candidates are inside DNS/HTTPS I/O at any moment.
class verifier {
 public:
  /// Uses `resolv_dns_probe` and `curl_https_probe`.
  verifier();
  verifier(std::shared_ptr<dns_probe> dns, std::shared_ptr<https_probe> https) noexcept;

  /// Rejects a bad `cfg` with `invalid_concurrency`, `invalid_timeout` or
  /// `invalid_argument` before any probe runs. An empty candidate set returns
  /// immediately. Fails with `resource_exhausted` if the worker threads cannot be
  /// started.
  ///
  /// When `stop` is requested, remaining candidates are skipped, in-flight transfers
  /// are aborted, and the partial result comes back with `cancelled` set.
  auto scan(candidate_set const& candidates, scan_config const& cfg,
            std::stop_token stop = {}) const -> io_result<scan_result>;

 private:
  auto resolves(std::string const& name, scan_config const& cfg) const -> bool;
  auto answers_https(std::string const& name, scan_config const& cfg,
                     std::stop_token const& stop) const -> io_result<bool>;

  std::shared_ptr<dns_probe> dns_;
  std::shared_ptr<https_probe> https_;
};

/// Shorthand for `verifier{}.scan(candidates, cfg, stop)`.
auto scan(candidate_set const& candidates, scan_config const& cfg, std::stop_token stop = {})
  -> io_result<scan_result>;

}  // namespace subscan
