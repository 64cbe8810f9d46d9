#pragma once

#include <string>
#include <unordered_set>

namespace subscan {

/// Fully-qualified subdomain names. Identity is the exact string; order is irrelevant.
using candidate_set = std::unordered_set<std::string>;

/// Outcome of one scan invocation.
///
/// Invariant: every member of `https_alive` is also in `dns_resolved`.
struct scan_result {
  candidate_set dns_resolved{};
  candidate_set https_alive{};

  /// True if the scan was stopped before every candidate was checked. The sets then hold
  /// the partial outcome gathered up to that point.
  bool cancelled = false;
};

}  // namespace subscan
