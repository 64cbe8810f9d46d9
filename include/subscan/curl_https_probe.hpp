#pragma once

#include <subscan/probe.hpp>

namespace subscan {

/// `https_probe` over libcurl, one easy handle per request.
///
/// Certificate and host-name verification are off: the probe answers "does something
/// speak HTTPS here", not "is it trusted". The configured timeout bounds the whole
/// transfer including redirects.
class curl_https_probe final : public https_probe {
 public:
  /// Performs process-wide libcurl initialisation on first construction.
  curl_https_probe();

  auto head(https_request const& req) -> io_result<int> override;
};

}  // namespace subscan
