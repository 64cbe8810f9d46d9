#pragma once

#include <subscan/probe.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace subscan {

/// A nameserver given by numeric IPv4 or IPv6 address.
struct nameserver {
  std::string address{};
  std::uint16_t port = 53;
};

/// `dns_probe` over UDP, built on libresolv.
///
/// Queries are encoded with `res_nmkquery()` and exchanged over a socket owned by the
/// call, so concurrent lookups share nothing. By default the nameservers come from
/// `/etc/resolv.conf`.
///
/// `timeout` bounds the whole lookup with millisecond resolution. Servers are tried in
/// order, one query each; every server gets an equal share of the time still left.
/// A server that fails (SERVFAIL, REFUSED, unreachable, garbage) hands over to the next.
class resolv_dns_probe final : public dns_probe {
 public:
  resolv_dns_probe() = default;

  /// Query `nameservers` instead of the system list.
  explicit resolv_dns_probe(std::vector<nameserver> nameservers);

  auto lookup(std::string const& name, dns_record_type type, std::chrono::milliseconds timeout)
    -> void_result override;

 private:
  std::vector<nameserver> nameservers_{};
};

}  // namespace subscan
