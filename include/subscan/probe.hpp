#pragma once

#include <subscan/result.hpp>

#include <chrono>
#include <stop_token>
#include <string>

namespace subscan {

enum class dns_record_type {
  a,
  cname,
};

/// DNS lookup seam used by the verifier.
///
/// Implementations report every failure (NXDOMAIN, empty answer, timeout, transport)
/// as an error code. They may be called concurrently from several threads.
class dns_probe {
 public:
  virtual ~dns_probe() = default;

  dns_probe() = default;
  dns_probe(dns_probe const&) = delete;
  auto operator=(dns_probe const&) -> dns_probe& = delete;
  dns_probe(dns_probe&&) = delete;
  auto operator=(dns_probe&&) -> dns_probe& = delete;

  /// `ok()` iff the answer section holds at least one record of `type` for `name`.
  virtual auto lookup(std::string const& name, dns_record_type type,
                      std::chrono::milliseconds timeout) -> void_result = 0;
};

struct https_request {
  std::string host{};
  std::chrono::milliseconds timeout{};
  std::string user_agent{};
  int max_redirects = 10;

  /// Aborts an in-flight transfer once stop is requested.
  std::stop_token stop{};
};

/// HTTPS liveness seam used by the verifier.
///
/// Issues `HEAD https://<host>/` without certificate validation, following redirects.
/// May be called concurrently from several threads.
class https_probe {
 public:
  virtual ~https_probe() = default;

  https_probe() = default;
  https_probe(https_probe const&) = delete;
  auto operator=(https_probe const&) -> https_probe& = delete;
  https_probe(https_probe&&) = delete;
  auto operator=(https_probe&&) -> https_probe& = delete;

  /// Final HTTP status code, or the transport error that prevented one.
  virtual auto head(https_request const& req) -> io_result<int> = 0;
};

}  // namespace subscan
