#pragma once

#include <array>
#include <span>
#include <string_view>

namespace subscan {

namespace words {

/// Highest-probability single labels. Applied in every mode.
inline constexpr auto base = std::to_array<std::string_view>({
  "www",    "mail", "api", "admin",  "blog",   "dev", "staging", "test", "mobile",
  "static", "cdn",  "portal", "app", "secure", "vpn", "m",       "old",  "new",
});

/// Infrastructure vocabulary: mail, DNS, ops, commerce, dev environments, data stores.
inline constexpr auto dictionary = std::to_array<std::string_view>({
  "www",     "mail",      "ftp",           "smtp",     "pop",         "imap",     "webmail",
  "admin",   "administrator", "login",     "dashboard", "panel",      "api",      "api2",
  "api3",    "vpn",       "remote",        "ssh",      "dev",         "development", "staging",
  "test",    "qa",        "blog",          "news",     "forum",       "support",  "help",
  "docs",    "app",       "apps",          "application", "portal",   "hub",      "static",
  "assets",  "cdn",       "media",         "images",   "img",         "shop",     "store",
  "ecommerce", "payment", "pay",           "m",        "mobile",      "wap",      "i",
  "iphone",  "secure",    "ssl",           "safe",     "private",     "cpanel",   "whm",
  "webdisk", "webhost",   "ns1",           "ns2",      "ns3",         "dns",      "mx",
  "mx1",     "mx2",       "git",           "svn",      "repo",        "code",     "status",
  "monitor", "monitoring", "metrics",      "db",       "database",    "sql",      "mysql",
  "postgres",
});

/// Ordered: lower modes use a prefix of this list.
inline constexpr auto environments = std::to_array<std::string_view>({
  "dev", "test", "staging", "prod", "production", "uat", "qa",
});

inline constexpr auto geo_codes = std::to_array<std::string_view>({
  "us", "uk", "eu", "de", "fr", "jp", "sg", "au", "in",
});

/// Vocabulary for the word-combination layer.
inline constexpr auto combination_vocabulary = std::to_array<std::string_view>({
  "admin", "api", "web", "app", "dev", "test",
});

/// Fixed single tokens added in ultimate mode.
inline constexpr auto special = std::to_array<std::string_view>({
  "alpha",  "beta",   "gamma", "internal", "external", "legacy", "modern",
  "cloud",  "aws",    "azure", "office",   "home",     "remote",
});

}  // namespace words

/// Non-owning view over the generator's static vocabulary.
///
/// The default instance points into `subscan::words`; tests or callers may point the
/// spans at their own arrays (which must outlive the generator).
struct wordlists {
  std::span<std::string_view const> base = words::base;
  std::span<std::string_view const> dictionary = words::dictionary;
  std::span<std::string_view const> environments = words::environments;
  std::span<std::string_view const> geo_codes = words::geo_codes;
  std::span<std::string_view const> combination_vocabulary = words::combination_vocabulary;
  std::span<std::string_view const> special = words::special;
};

}  // namespace subscan
