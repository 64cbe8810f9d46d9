#pragma once

#include <string>
#include <string_view>

namespace subscan::detail {

inline auto to_lower_ascii(std::string_view s) -> std::string {
  std::string out{};
  out.reserve(s.size());
  for (char c : s) {
    out.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c);
  }
  return out;
}

}  // namespace subscan::detail
