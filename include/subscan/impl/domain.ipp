#include <subscan/domain.hpp>

#include <subscan/detail/ascii.hpp>

#include <cctype>

namespace subscan {

namespace detail {

inline constexpr std::string_view www_prefix = "www.";

inline auto is_space(char c) noexcept -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline auto is_label_char(char c) noexcept -> bool {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '-';
}

inline auto strip_scheme(std::string_view s) noexcept -> std::string_view {
  for (std::string_view scheme : {std::string_view{"https://"}, std::string_view{"http://"}}) {
    if (s.starts_with(scheme)) {
      return s.substr(scheme.size());
    }
  }
  return s;
}

}  // namespace detail

inline auto domain::is_valid(std::string_view text) noexcept -> bool {
  // ^[a-z0-9.-]+\.[a-z]{2,}$ : a non-empty head, a dot, then a TLD of >= 2 letters.
  auto const dot = text.rfind('.');
  if (dot == std::string_view::npos || dot == 0) {
    return false;
  }

  auto const head = text.substr(0, dot);
  auto const tld = text.substr(dot + 1);
  if (tld.size() < 2) {
    return false;
  }
  for (char c : tld) {
    if (c < 'a' || c > 'z') {
      return false;
    }
  }
  for (char c : head) {
    if (!detail::is_label_char(c)) {
      return false;
    }
  }
  return true;
}

inline auto domain::parse(std::string_view text) -> io_result<domain> {
  auto first = text.find_first_not_of(" \t\r\n\f\v");
  if (first == std::string_view::npos) {
    return unexpected(error::invalid_domain);
  }
  auto last = text.find_last_not_of(" \t\r\n\f\v");
  text = text.substr(first, last - first + 1);

  for (char c : text) {
    if (detail::is_space(c)) {
      return unexpected(error::invalid_domain);
    }
  }

  auto const lowered = detail::to_lower_ascii(text);

  std::string_view s = detail::strip_scheme(lowered);
  if (auto slash = s.find('/'); slash != std::string_view::npos) {
    s = s.substr(0, slash);
  }

  if (!is_valid(s)) {
    return unexpected(error::invalid_domain);
  }
  return domain{std::string{s}};
}

inline auto domain::without_www() const -> std::string_view {
  std::string_view s = name_;
  // `www.com` stays as is: stripping must leave a registrable domain behind.
  if (s.starts_with(detail::www_prefix) && is_valid(s.substr(detail::www_prefix.size()))) {
    return s.substr(detail::www_prefix.size());
  }
  return s;
}

}  // namespace subscan
