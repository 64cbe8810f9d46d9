#include <subscan/subscan.hpp>
#include <subscan/impl.hpp>

#include <fmt/format.h>

#include <pthread.h>
#include <signal.h>

#include <charconv>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

namespace {

constexpr char usage_text[] =
  "usage: subscan_cli <domain> [normal|medium|ultimate] [options]\n"
  "       subscan_cli --interactive [options]\n"
  "\n"
  "options:\n"
  "  --quick             cap concurrency at 20\n"
  "  --concurrency N     override the mode's concurrency\n"
  "  --timeout-ms N      override the mode's per-check timeout\n"
  "  --workers N         worker threads (default: concurrency)\n"
  "  --output DIR        report directory (default: scan_results)\n"
  "  --no-report         do not write a report file\n"
  "  --log-level LEVEL   trace|debug|info|warn|error|off\n"
  "  --verbose           same as --log-level debug\n"
  "  --quiet             same as --log-level error\n";

struct cli_options {
  std::string domain_text{};
  std::string mode_text{"normal"};
  bool interactive = false;
  bool quick = false;
  std::optional<int> concurrency{};
  std::optional<int> timeout_ms{};
  std::optional<int> workers{};
  std::filesystem::path output_dir{"scan_results"};
  bool write_report = true;
};

auto parse_int(std::string_view s) -> std::optional<int> {
  int v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return v;
}

// Returns nullopt after printing a diagnostic.
auto parse_args(int argc, char* argv[]) -> std::optional<cli_options> {
  cli_options opts{};
  int positional = 0;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    auto take_value = [&](std::string_view flag) -> std::optional<std::string_view> {
      if (i + 1 >= argc) {
        std::cerr << "subscan_cli: " << flag << " needs a value\n";
        return std::nullopt;
      }
      return std::string_view{argv[++i]};
    };
    auto take_int = [&](std::string_view flag) -> std::optional<int> {
      auto v = take_value(flag);
      if (!v) {
        return std::nullopt;
      }
      auto n = parse_int(*v);
      if (!n) {
        std::cerr << "subscan_cli: " << flag << ": not a number: " << *v << "\n";
      }
      return n;
    };

    if (arg == "-h" || arg == "--help") {
      std::cout << usage_text;
      return std::nullopt;
    } else if (arg == "--interactive") {
      opts.interactive = true;
    } else if (arg == "--quick") {
      opts.quick = true;
    } else if (arg == "--no-report") {
      opts.write_report = false;
    } else if (arg == "--verbose") {
      subscan::set_log_level(subscan::log_level::debug);
    } else if (arg == "--quiet") {
      subscan::set_log_level(subscan::log_level::error);
    } else if (arg == "--log-level") {
      auto v = take_value(arg);
      if (!v) {
        return std::nullopt;
      }
      auto level = subscan::parse_log_level(*v);
      if (!level) {
        std::cerr << "subscan_cli: unknown log level: " << *v << "\n";
        return std::nullopt;
      }
      subscan::set_log_level(*level);
    } else if (arg == "--concurrency") {
      if (!(opts.concurrency = take_int(arg))) {
        return std::nullopt;
      }
    } else if (arg == "--timeout-ms") {
      if (!(opts.timeout_ms = take_int(arg))) {
        return std::nullopt;
      }
    } else if (arg == "--workers") {
      if (!(opts.workers = take_int(arg))) {
        return std::nullopt;
      }
    } else if (arg == "--output") {
      auto v = take_value(arg);
      if (!v) {
        return std::nullopt;
      }
      opts.output_dir = std::filesystem::path{std::string{*v}};
    } else if (arg.starts_with("--")) {
      std::cerr << "subscan_cli: unknown option: " << arg << "\n" << usage_text;
      return std::nullopt;
    } else if (positional == 0) {
      opts.domain_text = std::string{arg};
      ++positional;
    } else if (positional == 1) {
      opts.mode_text = std::string{arg};
      ++positional;
    } else {
      std::cerr << "subscan_cli: unexpected argument: " << arg << "\n" << usage_text;
      return std::nullopt;
    }
  }

  if (!opts.interactive && opts.domain_text.empty()) {
    std::cerr << usage_text;
    return std::nullopt;
  }
  return opts;
}

void apply_overrides(cli_options const& opts, subscan::scan_config& cfg) {
  if (opts.concurrency) {
    cfg.concurrency = *opts.concurrency;
  }
  if (opts.timeout_ms) {
    cfg.timeout = std::chrono::milliseconds{*opts.timeout_ms};
  }
  if (opts.workers) {
    cfg.worker_threads = *opts.workers;
  }
}

// Turns SIGINT/SIGTERM into a stop request. Signals are blocked in every thread and
// consumed here with sigwait(); SIGUSR1 only ends the watcher.
class signal_watcher {
 public:
  explicit signal_watcher(std::stop_source stop) {
    sigemptyset(&set_);
    sigaddset(&set_, SIGINT);
    sigaddset(&set_, SIGTERM);
    sigaddset(&set_, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &set_, nullptr);

    thread_ = std::thread([this, stop]() mutable {
      int sig = 0;
      if (sigwait(&set_, &sig) == 0 && sig != SIGUSR1) {
        std::cerr << "\nsubscan_cli: interrupted, finishing in-flight checks...\n";
        stop.request_stop();
      }
    });
  }

  signal_watcher(signal_watcher const&) = delete;
  auto operator=(signal_watcher const&) -> signal_watcher& = delete;

  ~signal_watcher() {
    pthread_kill(thread_.native_handle(), SIGUSR1);
    thread_.join();
  }

 private:
  sigset_t set_{};
  std::thread thread_{};
};

auto run_scan(subscan::scan_request const& req, cli_options const& opts, std::stop_token stop)
  -> subscan::io_result<subscan::scan_result> {
  auto const& [target, selected, cfg] = req;

  std::cout << fmt::format("Generating subdomains for {} ({} mode)...\n", target.str(),
                           subscan::to_string(selected));
  auto candidates = subscan::generate(target, selected);
  std::cout << fmt::format("Generated {} candidates (estimate {})\n", candidates.size(),
                           subscan::candidate_generator::estimate_count(selected));
  std::cout << fmt::format("Checking with concurrency {} and timeout {}ms...\n",
                           cfg.concurrency, cfg.timeout.count());

  auto r = subscan::scan(candidates, cfg, stop);
  if (!r) {
    return r;
  }

  std::cout << "\n" << subscan::format_summary(*r);

  if (opts.write_report) {
    auto path = subscan::write_report(opts.output_dir, target, *r);
    if (!path) {
      std::cerr << "subscan_cli: report: " << path.error().message() << "\n";
    } else {
      std::cout << "\nResults saved to: " << path->string() << "\n";
    }
  }
  return r;
}

auto build_request(cli_options const& opts) -> subscan::io_result<subscan::scan_request> {
  auto d = subscan::domain::parse(opts.domain_text);
  if (!d) {
    return subscan::unexpected(d.error());
  }
  auto m = subscan::parse_mode(opts.mode_text);
  if (!m) {
    return subscan::unexpected(m.error());
  }
  auto cfg = opts.quick ? subscan::quick_config(*m) : subscan::config_for(*m);
  apply_overrides(opts, cfg);
  return subscan::scan_request{std::move(*d), *m, std::move(cfg)};
}

auto prompt(std::string_view text, std::string& line) -> bool {
  std::cout << text << std::flush;
  return static_cast<bool>(std::getline(std::cin, line));
}

// One conversation per target; "cancel" at any prompt starts over, EOF or "quit" ends.
auto run_interactive(cli_options const& opts, std::stop_source& stop_src) -> int {
  subscan::scan_session session{};
  std::string line{};

  std::cout << "Subdomain scanner. Type 'cancel' to start over, 'quit' to exit.\n";
  while (!stop_src.stop_requested()) {
    switch (session.state()) {
      case subscan::session_state::awaiting_domain: {
        if (!prompt("domain> ", line) || line == "quit") {
          return 0;
        }
        if (line == "cancel") {
          break;
        }
        if (auto r = session.submit_domain(line); !r) {
          std::cout << "Invalid domain format. Please enter a valid domain (e.g., example.com)\n";
        }
        break;
      }
      case subscan::session_state::awaiting_mode: {
        if (!prompt("mode [normal|medium|ultimate]> ", line) || line == "quit") {
          return 0;
        }
        if (line == "cancel") {
          session.reset();
          break;
        }
        auto m = subscan::parse_mode(line.empty() ? std::string_view{"normal"} : line);
        if (!m) {
          std::cout << "Unknown mode: " << line << "\n";
          break;
        }
        if (auto r = session.select_mode(*m); !r) {
          std::cerr << "subscan_cli: " << r.error().message() << "\n";
          session.reset();
          break;
        }
        std::cout << fmt::format("Target: {}  Mode: {}  (~{} candidates)\n",
                                 session.target()->str(), subscan::to_string(*m),
                                 subscan::candidate_generator::estimate_count(*m));
        break;
      }
      case subscan::session_state::awaiting_confirmation: {
        if (!prompt("start scan? [y/N]> ", line) || line == "quit") {
          return 0;
        }
        if (line != "y" && line != "Y" && line != "yes") {
          session.reset();
          break;
        }
        auto req = session.confirm(opts.quick);
        if (!req) {
          std::cerr << "subscan_cli: " << req.error().message() << "\n";
          session.reset();
          break;
        }
        apply_overrides(opts, req->config);
        auto r = run_scan(*req, opts, stop_src.get_token());
        if (!r) {
          std::cerr << "subscan_cli: scan: " << r.error().message() << "\n";
          session.reset();
          break;
        }
        if (auto c = session.complete(std::move(*r)); !c) {
          std::cerr << "subscan_cli: " << c.error().message() << "\n";
        }
        break;
      }
      case subscan::session_state::scanning:
        // Scans run synchronously; the session never rests here between prompts.
        session.reset();
        break;
      case subscan::session_state::finished:
        std::cout << "\n";
        session.reset();
        break;
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  if (!opts) {
    return 1;
  }

  std::stop_source stop_src{};
  signal_watcher watcher{stop_src};

  if (opts->interactive) {
    return run_interactive(*opts, stop_src);
  }

  auto req = build_request(*opts);
  if (!req) {
    std::cerr << "subscan_cli: " << req.error().message() << "\n";
    return 1;
  }

  auto r = run_scan(*req, *opts, stop_src.get_token());
  if (!r) {
    std::cerr << "subscan_cli: scan: " << r.error().message() << "\n";
    return 1;
  }
  return r->cancelled ? 130 : 0;
}
