#include <subscan/resolv_dns_probe.hpp>

#include <subscan/detail/scope_guard.hpp>
#include <subscan/log.hpp>

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <resolv.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>
#include <optional>
#include <utility>

namespace subscan {

namespace detail {

inline constexpr std::size_t dns_packet_size = 4096;

struct dns_endpoint {
  sockaddr_storage addr{};
  socklen_t len = 0;
};

inline auto to_ns_type(dns_record_type type) noexcept -> ns_type {
  switch (type) {
    case dns_record_type::a:
      return ns_t_a;
    case dns_record_type::cname:
      return ns_t_cname;
  }
  return ns_t_a;
}

inline auto to_endpoint(nameserver const& ns) -> std::optional<dns_endpoint> {
  dns_endpoint ep{};

  auto* v4 = reinterpret_cast<sockaddr_in*>(&ep.addr);
  if (::inet_pton(AF_INET, ns.address.c_str(), &v4->sin_addr) == 1) {
    v4->sin_family = AF_INET;
    v4->sin_port = htons(ns.port);
    ep.len = sizeof(sockaddr_in);
    return ep;
  }

  auto* v6 = reinterpret_cast<sockaddr_in6*>(&ep.addr);
  if (::inet_pton(AF_INET6, ns.address.c_str(), &v6->sin6_addr) == 1) {
    v6->sin6_family = AF_INET6;
    v6->sin6_port = htons(ns.port);
    ep.len = sizeof(sockaddr_in6);
    return ep;
  }
  return std::nullopt;
}

// glibc keeps IPv6 servers out of nsaddr_list (family 0) and in _u._ext.nsaddrs.
inline auto system_nameservers(struct __res_state const& st) -> std::vector<dns_endpoint> {
  std::vector<dns_endpoint> out{};
  for (int i = 0; i < std::min(st.nscount, MAXNS); ++i) {
    dns_endpoint ep{};
    if (st.nsaddr_list[i].sin_family == AF_INET) {
      std::memcpy(&ep.addr, &st.nsaddr_list[i], sizeof(sockaddr_in));
      ep.len = sizeof(sockaddr_in);
    } else if (st._u._ext.nsaddrs[i] != nullptr) {
      std::memcpy(&ep.addr, st._u._ext.nsaddrs[i], sizeof(sockaddr_in6));
      ep.len = sizeof(sockaddr_in6);
    } else {
      continue;
    }
    out.push_back(ep);
  }
  return out;
}

inline auto message_id(unsigned char const* packet) noexcept -> unsigned {
  return (static_cast<unsigned>(packet[0]) << 8) | packet[1];
}

inline auto errno_code() noexcept -> std::error_code {
  return std::error_code(errno, std::generic_category());
}

// Sends one query to `ep` and waits for the reply carrying the same id. Stray
// datagrams are dropped; the wait never outlives `deadline`.
inline auto exchange(dns_endpoint const& ep, unsigned char const* query, int query_len,
                     unsigned char* reply, std::size_t reply_size,
                     std::chrono::steady_clock::time_point deadline) -> io_result<int> {
  int const fd = ::socket(ep.addr.ss_family, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return unexpected(errno_code());
  }
  auto close_fd = make_scope_exit([fd]() noexcept { ::close(fd); });

  if (::connect(fd, reinterpret_cast<sockaddr const*>(&ep.addr), ep.len) != 0) {
    return unexpected(errno_code());
  }
  auto const sent = ::send(fd, query, static_cast<std::size_t>(query_len), 0);
  if (sent < 0) {
    return unexpected(errno_code());
  }
  if (sent != query_len) {
    return unexpected(make_error_code(error::dns_failure));
  }

  for (;;) {
    auto const left = std::chrono::ceil<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if (left <= std::chrono::milliseconds::zero()) {
      return unexpected(make_error_code(error::dns_timed_out));
    }

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    auto const wait_ms =
      std::min<std::chrono::milliseconds::rep>(left.count(), std::numeric_limits<int>::max());
    int const ready = ::poll(&pfd, 1, static_cast<int>(wait_ms));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return unexpected(errno_code());
    }
    if (ready == 0) {
      continue;
    }

    auto const got = ::recv(fd, reply, reply_size, 0);
    if (got < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      // ECONNREFUSED: nothing listens on the server port.
      return unexpected(errno_code());
    }
    if (got >= HFIXEDSZ && message_id(reply) == message_id(query)) {
      return static_cast<int>(got);
    }
  }
}

// Final outcomes are dns_not_found, dns_no_answer and ok(); dns_failure means the
// next server should be asked.
inline auto classify_reply(unsigned char const* reply, int len, ns_type qtype) -> void_result {
  ns_msg msg{};
  if (ns_initparse(reply, len, &msg) < 0) {
    return fail(error::dns_failure);
  }

  switch (ns_msg_getflag(msg, ns_f_rcode)) {
    case ns_r_noerror:
      break;
    case ns_r_nxdomain:
      return fail(error::dns_not_found);
    default:
      return fail(error::dns_failure);
  }

  auto const count = ns_msg_count(msg, ns_s_an);
  for (int i = 0; i < count; ++i) {
    ns_rr rr{};
    if (ns_parserr(&msg, ns_s_an, i, &rr) != 0) {
      return fail(error::dns_failure);
    }
    if (ns_rr_type(rr) == qtype) {
      return ok();
    }
  }
  return fail(error::dns_no_answer);
}

}  // namespace detail

inline resolv_dns_probe::resolv_dns_probe(std::vector<nameserver> nameservers)
    : nameservers_(std::move(nameservers)) {}

inline auto resolv_dns_probe::lookup(std::string const& name, dns_record_type type,
                                     std::chrono::milliseconds timeout) -> void_result {
  auto const deadline = std::chrono::steady_clock::now() + timeout;

  struct __res_state st;
  std::memset(&st, 0, sizeof(st));
  if (res_ninit(&st) != 0) {
    log_warn("resolv_dns_probe: res_ninit failed");
    return fail(error::dns_failure);
  }
  auto close_state = detail::make_scope_exit([&st]() noexcept { res_nclose(&st); });

  std::vector<detail::dns_endpoint> servers{};
  if (nameservers_.empty()) {
    servers = detail::system_nameservers(st);
  } else {
    for (auto const& ns : nameservers_) {
      if (auto ep = detail::to_endpoint(ns)) {
        servers.push_back(*ep);
      } else {
        log_warn("resolv_dns_probe: not a numeric address: {}", ns.address);
      }
    }
  }
  if (servers.empty()) {
    log_warn("resolv_dns_probe: no usable nameserver");
    return fail(error::dns_failure);
  }

  auto const qtype = detail::to_ns_type(type);
  std::array<unsigned char, detail::dns_packet_size> query{};
  int const query_len = res_nmkquery(&st, ns_o_query, name.c_str(), ns_c_in, qtype, nullptr, 0,
                                     nullptr, query.data(), static_cast<int>(query.size()));
  if (query_len < 0) {
    log_debug("resolv_dns_probe: {}: cannot encode query", name);
    return fail(error::dns_failure);
  }

  std::array<unsigned char, detail::dns_packet_size> reply{};
  bool all_timed_out = true;
  for (std::size_t i = 0; i < servers.size(); ++i) {
    auto const now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }
    auto const remaining_servers = static_cast<std::chrono::steady_clock::rep>(servers.size() - i);
    auto const share = (deadline - now) / remaining_servers;

    auto len = detail::exchange(servers[i], query.data(), query_len, reply.data(), reply.size(),
                                now + share);
    if (!len) {
      if (len.error() != error::dns_timed_out) {
        all_timed_out = false;
      }
      log_trace("dns: {}: nameserver #{}: {}", name, i, len.error().message());
      continue;
    }

    auto r = detail::classify_reply(reply.data(), *len, qtype);
    if (r || r.error() != error::dns_failure) {
      return r;
    }
    all_timed_out = false;
    log_trace("dns: {}: nameserver #{}: unusable reply", name, i);
  }
  return fail(all_timed_out ? error::dns_timed_out : error::dns_failure);
}

}  // namespace subscan
