#pragma once

#include <system_error>
#include <type_traits>

namespace subscan {

enum class error {
  /// Operation cancelled through a stop token.
  operation_aborted = 1,

  /// Invalid argument / malformed input (library-level)
  invalid_argument,

  /// Text is not a valid root domain.
  invalid_domain,

  /// Unknown scan mode token.
  invalid_mode,

  /// scan_config::concurrency must be > 0.
  invalid_concurrency,

  /// scan_config::timeout must be > 0.
  invalid_timeout,

  /// The resolver reported NXDOMAIN.
  dns_not_found,

  /// The name exists but has no record of the requested type.
  dns_no_answer,

  /// The resolver did not answer in time.
  dns_timed_out,

  /// Any other resolver failure.
  dns_failure,

  /// TCP connection to the HTTPS endpoint failed.
  https_connect_failed,

  /// TLS handshake failed.
  https_tls_failed,

  /// The HTTPS request did not complete in time.
  https_timed_out,

  /// Any other HTTP transfer failure.
  https_failure,

  /// Session event is not valid in the current state.
  invalid_state,

  /// Scan report could not be written.
  report_write_failed,

  /// The system refused a resource the scan needs (e.g. worker threads).
  resource_exhausted,
};

auto make_error_code(error e) -> std::error_code;

}  // namespace subscan

namespace std {

template <>
struct is_error_code_enum<subscan::error> : std::true_type {};

}  // namespace std
