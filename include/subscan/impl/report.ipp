#include <subscan/report.hpp>

#include <subscan/log.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iterator>
#include <system_error>

namespace subscan {

namespace detail {

inline constexpr std::size_t summary_rule_width = 40;
inline constexpr std::size_t report_rule_width = 50;
inline constexpr std::size_t section_rule_width = 30;

inline auto local_tm(std::chrono::system_clock::time_point at) -> std::tm {
  auto const t = std::chrono::system_clock::to_time_t(at);
  std::tm tm{};
  if (::localtime_r(&t, &tm) == nullptr) {
    return std::tm{};
  }
  return tm;
}

}  // namespace detail

inline auto sorted(candidate_set const& names) -> std::vector<std::string> {
  std::vector<std::string> out(names.begin(), names.end());
  std::sort(out.begin(), out.end());
  return out;
}

inline auto format_summary(scan_result const& r) -> std::string {
  std::string const rule(detail::summary_rule_width, '=');

  std::string out{};
  auto it = std::back_inserter(out);
  fmt::format_to(it, "{}\nSCAN RESULTS SUMMARY\n{}\n", rule, rule);
  fmt::format_to(it, "HTTPS alive: {} subdomains\n", r.https_alive.size());
  fmt::format_to(it, "DNS resolved: {} subdomains\n", r.dns_resolved.size());
  if (r.cancelled) {
    fmt::format_to(it, "(scan cancelled, results are partial)\n");
  }
  fmt::format_to(it, "{}\n", rule);

  if (!r.https_alive.empty()) {
    fmt::format_to(it, "\nHTTPS ALIVE SUBDOMAINS:\n");
    for (auto const& name : sorted(r.https_alive)) {
      fmt::format_to(it, "  https://{}\n", name);
    }
  }

  std::vector<std::string> dns_only{};
  for (auto const& name : sorted(r.dns_resolved)) {
    if (!r.https_alive.contains(name)) {
      dns_only.push_back(name);
    }
  }
  if (!dns_only.empty()) {
    fmt::format_to(it, "\nDNS ONLY SUBDOMAINS:\n");
    for (auto const& name : dns_only) {
      fmt::format_to(it, "  {}\n", name);
    }
  }
  return out;
}

inline auto report_file_name(domain const& d, std::chrono::system_clock::time_point at)
  -> std::string {
  return fmt::format("subdomain_scan_{}_{:%Y%m%d_%H%M%S}.txt", d.str(), detail::local_tm(at));
}

inline auto format_report(domain const& d, scan_result const& r,
                          std::chrono::system_clock::time_point at) -> std::string {
  std::string out{};
  auto it = std::back_inserter(out);
  fmt::format_to(it, "Subdomain Enumeration Results for {}\n", d.str());
  fmt::format_to(it, "Generated: {:%Y-%m-%d %H:%M:%S}\n", detail::local_tm(at));
  fmt::format_to(it, "{}\n\n", std::string(detail::report_rule_width, '='));

  std::string const section_rule(detail::section_rule_width, '-');

  fmt::format_to(it, "HTTPS Alive ({}):\n{}\n", r.https_alive.size(), section_rule);
  for (auto const& name : sorted(r.https_alive)) {
    fmt::format_to(it, "https://{}\n", name);
  }

  fmt::format_to(it, "\nDNS Resolved ({}):\n{}\n", r.dns_resolved.size(), section_rule);
  for (auto const& name : sorted(r.dns_resolved)) {
    fmt::format_to(it, "{}\n", name);
  }
  return out;
}

inline auto write_report(std::filesystem::path const& directory, domain const& d,
                         scan_result const& r, std::chrono::system_clock::time_point at)
  -> io_result<std::filesystem::path> {
  std::error_code ec{};
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    log_error("write_report: cannot create {}: {}", directory.string(), ec.message());
    return unexpected(make_error_code(error::report_write_failed));
  }

  auto path = directory / report_file_name(d, at);
  std::ofstream file{path, std::ios::out | std::ios::trunc};
  if (!file) {
    log_error("write_report: cannot open {}", path.string());
    return unexpected(make_error_code(error::report_write_failed));
  }

  file << format_report(d, r, at);
  file.close();
  if (!file) {
    log_error("write_report: write to {} failed", path.string());
    return unexpected(make_error_code(error::report_write_failed));
  }

  log_info("write_report: wrote {}", path.string());
  return path;
}

}  // namespace subscan
