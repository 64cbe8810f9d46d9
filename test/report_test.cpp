#include <gtest/gtest.h>

#include <subscan/report.hpp>
#include <subscan/impl.hpp>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace {

auto sample_result() -> subscan::scan_result {
  subscan::scan_result r{};
  r.dns_resolved = {"old.example.com", "api.example.com", "mail.example.com"};
  r.https_alive = {"api.example.com"};
  return r;
}

auto sample_domain() -> subscan::domain { return subscan::domain::parse("example.com").value(); }

TEST(report_test, sorted_orders_names) {
  auto v = subscan::sorted({"b.example.com", "a.example.com", "c.example.com"});
  EXPECT_EQ(v, (std::vector<std::string>{"a.example.com", "b.example.com", "c.example.com"}));
}

TEST(report_test, summary_lists_alive_then_dns_only) {
  auto const text = subscan::format_summary(sample_result());

  EXPECT_NE(text.find("SCAN RESULTS SUMMARY"), std::string::npos);
  EXPECT_NE(text.find("HTTPS alive: 1 subdomains"), std::string::npos);
  EXPECT_NE(text.find("DNS resolved: 3 subdomains"), std::string::npos);
  EXPECT_NE(text.find("  https://api.example.com\n"), std::string::npos);
  EXPECT_EQ(text.find("partial"), std::string::npos);

  auto const dns_only = text.find("DNS ONLY SUBDOMAINS:");
  ASSERT_NE(dns_only, std::string::npos);
  auto const mail = text.find("  mail.example.com\n", dns_only);
  auto const old = text.find("  old.example.com\n", dns_only);
  ASSERT_NE(mail, std::string::npos);
  ASSERT_NE(old, std::string::npos);
  EXPECT_LT(mail, old);
  EXPECT_EQ(text.find("  api.example.com\n", dns_only), std::string::npos);
}

TEST(report_test, summary_marks_cancelled_scans) {
  auto r = sample_result();
  r.cancelled = true;
  EXPECT_NE(subscan::format_summary(r).find("(scan cancelled, results are partial)"),
            std::string::npos);
}

TEST(report_test, summary_of_empty_result_has_no_sections) {
  auto const text = subscan::format_summary(subscan::scan_result{});
  EXPECT_NE(text.find("HTTPS alive: 0 subdomains"), std::string::npos);
  EXPECT_EQ(text.find("HTTPS ALIVE SUBDOMAINS"), std::string::npos);
  EXPECT_EQ(text.find("DNS ONLY SUBDOMAINS"), std::string::npos);
}

TEST(report_test, file_name_embeds_domain_and_timestamp) {
  auto const name = subscan::report_file_name(sample_domain(), std::chrono::system_clock::now());
  EXPECT_TRUE(name.starts_with("subdomain_scan_example.com_")) << name;
  EXPECT_TRUE(name.ends_with(".txt")) << name;
  // subdomain_scan_example.com_YYYYmmdd_HHMMSS.txt
  EXPECT_EQ(name.size(), std::string{"subdomain_scan_example.com_"}.size() + 15 + 4) << name;
}

TEST(report_test, file_name_uses_local_time) {
  auto const at = std::chrono::system_clock::from_time_t(1700000000);
  auto const t = std::chrono::system_clock::to_time_t(at);
  std::tm tm{};
  ASSERT_NE(::localtime_r(&t, &tm), nullptr);
  char stamp[32]{};
  ASSERT_GT(std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm), 0u);

  EXPECT_EQ(subscan::report_file_name(sample_domain(), at),
            std::string{"subdomain_scan_example.com_"} + stamp + ".txt");
}

TEST(report_test, report_sections) {
  auto const text =
    subscan::format_report(sample_domain(), sample_result(), std::chrono::system_clock::now());
  EXPECT_TRUE(text.starts_with("Subdomain Enumeration Results for example.com\n"));
  EXPECT_NE(text.find("Generated: "), std::string::npos);
  EXPECT_NE(text.find("HTTPS Alive (1):\n"), std::string::npos);
  EXPECT_NE(text.find("https://api.example.com\n"), std::string::npos);
  EXPECT_NE(text.find("DNS Resolved (3):\n"), std::string::npos);
  EXPECT_NE(text.find("\nmail.example.com\n"), std::string::npos);
}

TEST(report_test, write_report_creates_directory_and_file) {
  auto const dir = std::filesystem::temp_directory_path() /
                   ("subscan_report_test_" + std::to_string(::testing::UnitTest::GetInstance()
                                                              ->random_seed()));
  std::filesystem::remove_all(dir);

  auto const at = std::chrono::system_clock::now();
  auto path = subscan::write_report(dir / "nested", sample_domain(), sample_result(), at);
  ASSERT_TRUE(path) << path.error().message();
  EXPECT_TRUE(std::filesystem::exists(*path));
  EXPECT_EQ(path->filename().string(), subscan::report_file_name(sample_domain(), at));

  std::ifstream in{*path};
  std::stringstream contents;
  contents << in.rdbuf();
  EXPECT_EQ(contents.str(), subscan::format_report(sample_domain(), sample_result(), at));

  std::filesystem::remove_all(dir);
}

TEST(report_test, write_report_fails_when_directory_is_a_file) {
  auto const blocker = std::filesystem::temp_directory_path() / "subscan_report_test_blocker";
  std::filesystem::remove_all(blocker);
  {
    std::ofstream f{blocker};
    f << "x";
  }

  auto path = subscan::write_report(blocker, sample_domain(), sample_result());
  ASSERT_FALSE(path);
  EXPECT_EQ(path.error(), subscan::error::report_write_failed);

  std::filesystem::remove_all(blocker);
}

}  // namespace
