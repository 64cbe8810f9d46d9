#include <subscan/error.hpp>

#include <string>

namespace subscan {

namespace detail {

class error_category_impl : public std::error_category {
 public:
  auto name() const noexcept -> char const* override { return "subscan"; }

  auto message(int ev) const -> std::string override {
    switch (static_cast<error>(ev)) {
      case error::operation_aborted:
        return "operation aborted";

      // Input / configuration
      case error::invalid_argument:
        return "invalid argument";
      case error::invalid_domain:
        return "invalid domain";
      case error::invalid_mode:
        return "invalid scan mode";
      case error::invalid_concurrency:
        return "concurrency must be positive";
      case error::invalid_timeout:
        return "timeout must be positive";

      // DNS outcomes
      case error::dns_not_found:
        return "no such domain";
      case error::dns_no_answer:
        return "no answer for record type";
      case error::dns_timed_out:
        return "dns query timed out";
      case error::dns_failure:
        return "dns resolution failed";

      // HTTPS outcomes
      case error::https_connect_failed:
        return "https connect failed";
      case error::https_tls_failed:
        return "tls handshake failed";
      case error::https_timed_out:
        return "https request timed out";
      case error::https_failure:
        return "https request failed";

      // Driving client
      case error::invalid_state:
        return "invalid session state";
      case error::report_write_failed:
        return "report write failed";
      case error::resource_exhausted:
        return "resource exhausted";
      default:
        return "unknown error";
    }
  }
};

inline auto error_category() -> std::error_category const& {
  static error_category_impl instance;
  return instance;
}

}  // namespace detail

inline auto make_error_code(error e) -> std::error_code {
  return {static_cast<int>(e), detail::error_category()};
}

}  // namespace subscan
