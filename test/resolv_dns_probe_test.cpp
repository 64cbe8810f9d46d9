#include <gtest/gtest.h>

#include <subscan/resolv_dns_probe.hpp>
#include <subscan/impl.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

// UDP nameserver on 127.0.0.1 that answers every query the same way.
class local_dns_server {
 public:
  enum class behavior { silent, nxdomain, servfail, a_record };

  explicit local_dns_server(behavior b) : behavior_(b) {
    fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
      throw std::system_error(errno, std::generic_category(), "socket failed");
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len = sizeof(addr);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      int const err = errno;
      ::close(fd_);
      throw std::system_error(err, std::generic_category(), "bind failed");
    }
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this] { serve(); });
  }

  local_dns_server(local_dns_server const&) = delete;
  auto operator=(local_dns_server const&) -> local_dns_server& = delete;

  ~local_dns_server() {
    done_.store(true);
    thread_.join();
    ::close(fd_);
  }

  auto endpoint() const -> subscan::nameserver { return {"127.0.0.1", port_}; }

  std::atomic<int> queries{0};

 private:
  void serve() {
    while (!done_.load()) {
      pollfd pfd{};
      pfd.fd = fd_;
      pfd.events = POLLIN;
      if (::poll(&pfd, 1, 20) <= 0) {
        continue;
      }

      std::array<unsigned char, 512> buf{};
      sockaddr_in peer{};
      socklen_t peer_len = sizeof(peer);
      auto const n = ::recvfrom(fd_, buf.data(), buf.size(), 0,
                                reinterpret_cast<sockaddr*>(&peer), &peer_len);
      if (n < 12) {
        continue;
      }
      queries.fetch_add(1);
      if (behavior_ == behavior::silent) {
        continue;
      }

      auto const reply = make_reply(buf.data(), static_cast<std::size_t>(n));
      (void)::sendto(fd_, reply.data(), reply.size(), 0, reinterpret_cast<sockaddr*>(&peer),
                     peer_len);
    }
  }

  // Header and question of the query, flagged as a response.
  auto make_reply(unsigned char const* q, std::size_t n) const -> std::vector<unsigned char> {
    std::size_t end = 12;
    while (end < n && q[end] != 0) {
      end += q[end] + 1u;
    }
    end = std::min(end + 1 + 4, n);

    std::vector<unsigned char> out(q, q + end);
    out[2] |= 0x80;
    out[3] = 0x80;
    for (std::size_t i = 6; i < 12; ++i) {
      out[i] = 0;
    }
    switch (behavior_) {
      case behavior::nxdomain:
        out[3] |= 3;
        break;
      case behavior::servfail:
        out[3] |= 2;
        break;
      case behavior::a_record:
        out[7] = 1;
        out.insert(out.end(), {0xc0, 0x0c, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x3c, 0x00,
                               0x04, 192, 0, 2, 1});
        break;
      case behavior::silent:
        break;
    }
    return out;
  }

  behavior behavior_;
  int fd_ = -1;
  std::uint16_t port_ = 0;
  std::atomic<bool> done_{false};
  std::thread thread_{};
};

// Network-dependent tests skip when the resolver itself is unreachable.
auto should_skip_network_test(std::error_code ec) -> bool {
  return ec == subscan::error::dns_timed_out || ec == subscan::error::dns_failure;
}

TEST(resolv_dns_probe_test, resolves_a_record_of_well_known_name) {
  subscan::resolv_dns_probe probe{};
  auto r = probe.lookup("example.com", subscan::dns_record_type::a, 3s);
  if (!r && should_skip_network_test(r.error())) {
    GTEST_SKIP() << "network unavailable: " << r.error().message();
  }
  EXPECT_TRUE(r) << r.error().message();
}

TEST(resolv_dns_probe_test, reserved_invalid_tld_does_not_resolve) {
  subscan::resolv_dns_probe probe{};
  auto r = probe.lookup("no-such-host.invalid", subscan::dns_record_type::a, 3s);
  ASSERT_FALSE(r);
  if (should_skip_network_test(r.error())) {
    GTEST_SKIP() << "network unavailable: " << r.error().message();
  }
  EXPECT_EQ(r.error(), subscan::error::dns_not_found);
}

TEST(resolv_dns_probe_test, apex_without_cname_reports_no_answer) {
  subscan::resolv_dns_probe probe{};
  auto a = probe.lookup("example.com", subscan::dns_record_type::a, 3s);
  if (!a && should_skip_network_test(a.error())) {
    GTEST_SKIP() << "network unavailable: " << a.error().message();
  }

  // example.com has an A record and no CNAME at the apex.
  auto cname = probe.lookup("example.com", subscan::dns_record_type::cname, 3s);
  ASSERT_FALSE(cname);
  if (should_skip_network_test(cname.error())) {
    GTEST_SKIP() << "network unavailable: " << cname.error().message();
  }
  EXPECT_EQ(cname.error(), subscan::error::dns_no_answer);
}

TEST(resolv_dns_probe_test, sub_second_timeout_is_honoured) {
  local_dns_server server{local_dns_server::behavior::silent};
  subscan::resolv_dns_probe resolver{{server.endpoint()}};

  auto const start = std::chrono::steady_clock::now();
  auto r = resolver.lookup("www.example.com", subscan::dns_record_type::a, 300ms);
  auto const elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), subscan::error::dns_timed_out);
  EXPECT_GE(elapsed, 250ms);
  EXPECT_LT(elapsed, 900ms);
  EXPECT_EQ(server.queries.load(), 1);
}

TEST(resolv_dns_probe_test, timeout_is_shared_across_nameservers) {
  local_dns_server first{local_dns_server::behavior::silent};
  local_dns_server second{local_dns_server::behavior::silent};
  subscan::resolv_dns_probe resolver{{first.endpoint(), second.endpoint()}};

  auto const start = std::chrono::steady_clock::now();
  auto r = resolver.lookup("www.example.com", subscan::dns_record_type::a, 400ms);
  auto const elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), subscan::error::dns_timed_out);
  EXPECT_LT(elapsed, 900ms);
  EXPECT_EQ(first.queries.load(), 1);
  EXPECT_EQ(second.queries.load(), 1);
}

TEST(resolv_dns_probe_test, nxdomain_reply_maps_to_not_found) {
  local_dns_server server{local_dns_server::behavior::nxdomain};
  subscan::resolv_dns_probe resolver{{server.endpoint()}};

  auto r = resolver.lookup("missing.example.com", subscan::dns_record_type::a, 2s);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), subscan::error::dns_not_found);
}

TEST(resolv_dns_probe_test, answer_must_match_record_type) {
  local_dns_server server{local_dns_server::behavior::a_record};
  subscan::resolv_dns_probe resolver{{server.endpoint()}};

  EXPECT_TRUE(resolver.lookup("api.example.com", subscan::dns_record_type::a, 2s));

  auto cname = resolver.lookup("api.example.com", subscan::dns_record_type::cname, 2s);
  ASSERT_FALSE(cname);
  EXPECT_EQ(cname.error(), subscan::error::dns_no_answer);
}

TEST(resolv_dns_probe_test, failing_nameserver_hands_over_to_next) {
  local_dns_server broken{local_dns_server::behavior::servfail};
  local_dns_server working{local_dns_server::behavior::a_record};
  subscan::resolv_dns_probe resolver{{broken.endpoint(), working.endpoint()}};

  auto r = resolver.lookup("api.example.com", subscan::dns_record_type::a, 2s);
  EXPECT_TRUE(r) << r.error().message();
  EXPECT_EQ(broken.queries.load(), 1);
  EXPECT_EQ(working.queries.load(), 1);
}

TEST(resolv_dns_probe_test, servfail_everywhere_is_a_failure) {
  local_dns_server server{local_dns_server::behavior::servfail};
  subscan::resolv_dns_probe resolver{{server.endpoint()}};

  auto r = resolver.lookup("api.example.com", subscan::dns_record_type::a, 2s);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), subscan::error::dns_failure);
}

TEST(resolv_dns_probe_test, non_numeric_nameserver_is_rejected) {
  subscan::resolv_dns_probe resolver{{subscan::nameserver{"dns.example.net"}}};
  auto r = resolver.lookup("api.example.com", subscan::dns_record_type::a, 200ms);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), subscan::error::dns_failure);
}

}  // namespace
