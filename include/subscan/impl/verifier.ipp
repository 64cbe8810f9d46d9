#include <subscan/verifier.hpp>

#include <subscan/admission_gate.hpp>
#include <subscan/assert.hpp>
#include <subscan/curl_https_probe.hpp>
#include <subscan/log.hpp>
#include <subscan/resolv_dns_probe.hpp>
#include <subscan/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>
#include <utility>

namespace subscan {

namespace detail {

inline constexpr int https_alive_status_limit = 400;

// Result sets shared by all workers of one scan.
class result_collector {
 public:
  void add_resolved(std::string const& name) {
    std::scoped_lock lk{m_};
    result_.dns_resolved.insert(name);
  }

  // Callers must have added `name` as resolved first.
  void add_alive(std::string const& name) {
    std::scoped_lock lk{m_};
    SUBSCAN_ASSERT(result_.dns_resolved.contains(name));
    result_.https_alive.insert(name);
  }

  auto take() -> scan_result {
    std::scoped_lock lk{m_};
    return std::move(result_);
  }

 private:
  std::mutex m_{};
  scan_result result_{};
};

}  // namespace detail

inline verifier::verifier()
    : dns_(std::make_shared<resolv_dns_probe>()), https_(std::make_shared<curl_https_probe>()) {}

inline verifier::verifier(std::shared_ptr<dns_probe> dns,
                          std::shared_ptr<https_probe> https) noexcept
    : dns_(std::move(dns)), https_(std::move(https)) {}

inline auto verifier::scan(candidate_set const& candidates, scan_config const& cfg,
                           std::stop_token stop) const -> io_result<scan_result> {
  if (auto v = validate(cfg); !v) {
    return unexpected(v.error());
  }
  if (candidates.empty()) {
    return scan_result{};
  }
  SUBSCAN_ENSURE(dns_ && https_, "verifier: probes must not be null");

  auto const concurrency = static_cast<std::size_t>(cfg.concurrency);
  auto const wanted_workers =
    cfg.worker_threads > 0 ? static_cast<std::size_t>(cfg.worker_threads) : concurrency;
  auto const workers = std::min(wanted_workers, candidates.size());

  log_info("scan: {} candidates, concurrency {}, {} workers, timeout {}ms", candidates.size(),
           concurrency, workers, cfg.timeout.count());

  admission_gate gate{concurrency};
  detail::result_collector collector{};
  std::atomic<bool> interrupted{false};

  auto check_one = [&](std::string const& name) {
    if (stop.stop_requested()) {
      interrupted.store(true, std::memory_order_relaxed);
      return;
    }
    auto permit = gate.acquire(stop);
    if (!permit) {
      interrupted.store(true, std::memory_order_relaxed);
      return;
    }

    try {
      if (!resolves(name, cfg)) {
        return;
      }
      collector.add_resolved(name);

      if (stop.stop_requested()) {
        interrupted.store(true, std::memory_order_relaxed);
        return;
      }
      auto alive = answers_https(name, cfg, stop);
      if (!alive) {
        if (alive.error() == error::operation_aborted) {
          interrupted.store(true, std::memory_order_relaxed);
        }
        return;
      }
      if (*alive) {
        collector.add_alive(name);
      }
    } catch (std::exception const& e) {
      log_warn("scan: {}: unexpected error: {}", name, e.what());
    } catch (...) {
      log_warn("scan: {}: unexpected error: unknown exception", name);
    }
  };

  try {
    thread_pool pool{workers};
    for (auto const& name : candidates) {
      pool.post([&check_one, &name] { check_one(name); });
    }
    pool.join();
  } catch (std::system_error const& e) {
    log_error("scan: cannot run {} worker threads: {}", workers, e.what());
    return unexpected(make_error_code(error::resource_exhausted));
  }

  auto out = collector.take();
  out.cancelled = interrupted.load(std::memory_order_relaxed);
  log_info("scan: {} resolved, {} https alive{}", out.dns_resolved.size(), out.https_alive.size(),
           out.cancelled ? " (cancelled)" : "");
  return out;
}

inline auto verifier::resolves(std::string const& name, scan_config const& cfg) const -> bool {
  auto attempt = [&](dns_record_type type) -> bool {
    try {
      auto r = dns_->lookup(name, type, cfg.timeout);
      if (!r) {
        log_trace("dns: {} ({}): {}", name, type == dns_record_type::a ? "A" : "CNAME",
                  r.error().message());
      }
      return r.has_value();
    } catch (std::exception const& e) {
      log_debug("dns: {}: lookup threw: {}", name, e.what());
      return false;
    } catch (...) {
      log_debug("dns: {}: lookup threw: unknown exception", name);
      return false;
    }
  };

  if (attempt(dns_record_type::a) || attempt(dns_record_type::cname)) {
    log_debug("dns: {} resolved", name);
    return true;
  }
  return false;
}

inline auto verifier::answers_https(std::string const& name, scan_config const& cfg,
                                    std::stop_token const& stop) const -> io_result<bool> {
  https_request req{};
  req.host = name;
  req.timeout = cfg.timeout;
  req.user_agent = cfg.user_agent;
  req.max_redirects = cfg.max_redirects;
  req.stop = stop;

  auto status = https_->head(req);
  if (!status) {
    log_trace("https: {}: {}", name, status.error().message());
    return unexpected(status.error());
  }
  log_debug("https: {} -> {}", name, *status);
  return *status > 0 && *status < detail::https_alive_status_limit;
}

inline auto scan(candidate_set const& candidates, scan_config const& cfg, std::stop_token stop)
  -> io_result<scan_result> {
  return verifier{}.scan(candidates, cfg, std::move(stop));
}

}  // namespace subscan
