#pragma once

#include <subscan/domain.hpp>
#include <subscan/result.hpp>
#include <subscan/scan_result.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace subscan {

/// Members of `names` in ascending order.
auto sorted(candidate_set const& names) -> std::vector<std::string>;

/// Human-readable summary: counts, then `https://<name>` for alive hosts, then the
/// resolved names that did not answer HTTPS. Each list is sorted.
auto format_summary(scan_result const& r) -> std::string;

/// `subdomain_scan_<domain>_<YYYYmmdd_HHMMSS>.txt` for the local time of `at`.
auto report_file_name(domain const& d, std::chrono::system_clock::time_point at) -> std::string;

/// Full report text as written by `write_report()`.
auto format_report(domain const& d, scan_result const& r,
                   std::chrono::system_clock::time_point at) -> std::string;

/// Write the report into `directory` (created if missing) and return the file path.
///
/// Returns `error::report_write_failed` if the directory or the file cannot be written.
auto write_report(std::filesystem::path const& directory, domain const& d, scan_result const& r,
                  std::chrono::system_clock::time_point at = std::chrono::system_clock::now())
  -> io_result<std::filesystem::path>;

}  // namespace subscan
