#include <subscan/curl_https_probe.hpp>

#include <subscan/log.hpp>

#include <curl/curl.h>
#include <fmt/format.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <stop_token>

namespace subscan {

namespace detail {

struct curl_easy_deleter {
  void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};

using curl_easy_ptr = std::unique_ptr<CURL, curl_easy_deleter>;

inline void ensure_curl_global_init() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (auto rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK) {
      log_error("curl_https_probe: curl_global_init failed: {}", curl_easy_strerror(rc));
    }
  });
}

inline auto discard_body(char* /*ptr*/, std::size_t size, std::size_t nmemb, void* /*userdata*/)
  -> std::size_t {
  return size * nmemb;
}

// Non-zero return makes libcurl abort with CURLE_ABORTED_BY_CALLBACK.
inline auto abort_on_stop(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
  auto const* stop = static_cast<std::stop_token const*>(clientp);
  return stop->stop_requested() ? 1 : 0;
}

inline auto map_curl_error(CURLcode rc) noexcept -> std::error_code {
  switch (rc) {
    case CURLE_OPERATION_TIMEDOUT:
      return error::https_timed_out;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
      return error::https_connect_failed;
    case CURLE_SSL_CONNECT_ERROR:
      return error::https_tls_failed;
    case CURLE_ABORTED_BY_CALLBACK:
      return error::operation_aborted;
    default:
      return error::https_failure;
  }
}

}  // namespace detail

inline curl_https_probe::curl_https_probe() { detail::ensure_curl_global_init(); }

inline auto curl_https_probe::head(https_request const& req) -> io_result<int> {
  if (req.stop.stop_requested()) {
    return unexpected(make_error_code(error::operation_aborted));
  }

  detail::curl_easy_ptr h{curl_easy_init()};
  if (!h) {
    return unexpected(make_error_code(error::https_failure));
  }

  auto const url = fmt::format("https://{}/", req.host);
  auto const timeout_ms = static_cast<long>(req.timeout.count());
  std::stop_token stop = req.stop;

  CURLcode rc = CURLE_OK;
  auto set = [&](CURLoption opt, auto value) {
    if (rc == CURLE_OK) {
      rc = curl_easy_setopt(h.get(), opt, value);
    }
  };

  set(CURLOPT_URL, url.c_str());
  set(CURLOPT_NOBODY, 1L);
  set(CURLOPT_FOLLOWLOCATION, 1L);
  set(CURLOPT_MAXREDIRS, static_cast<long>(req.max_redirects));
  set(CURLOPT_SSL_VERIFYPEER, 0L);
  set(CURLOPT_SSL_VERIFYHOST, 0L);
  set(CURLOPT_USERAGENT, req.user_agent.c_str());
  set(CURLOPT_TIMEOUT_MS, timeout_ms);
  set(CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  // Worker threads must not receive SIGALRM from the resolver timeout path.
  set(CURLOPT_NOSIGNAL, 1L);
  set(CURLOPT_WRITEFUNCTION, &detail::discard_body);
  set(CURLOPT_XFERINFOFUNCTION, &detail::abort_on_stop);
  set(CURLOPT_XFERINFODATA, static_cast<void*>(&stop));
  set(CURLOPT_NOPROGRESS, 0L);
  if (rc != CURLE_OK) {
    log_warn("curl_https_probe: setopt failed: {}", curl_easy_strerror(rc));
    return unexpected(make_error_code(error::https_failure));
  }

  rc = curl_easy_perform(h.get());
  if (rc != CURLE_OK) {
    log_trace("curl_https_probe: {}: {}", url, curl_easy_strerror(rc));
    return unexpected(detail::map_curl_error(rc));
  }

  long status = 0;
  if (auto info_rc = curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &status);
      info_rc != CURLE_OK) {
    return unexpected(make_error_code(error::https_failure));
  }
  return static_cast<int>(status);
}

}  // namespace subscan
