#include <subscan/mode.hpp>

#include <subscan/detail/ascii.hpp>

#include <string>

namespace subscan {

inline auto to_string(mode m) noexcept -> std::string_view {
  switch (m) {
    case mode::normal:
      return "normal";
    case mode::medium:
      return "medium";
    case mode::ultimate:
      return "ultimate";
  }
  return "unknown";
}

inline auto parse_mode(std::string_view text) -> io_result<mode> {
  auto const lowered = detail::to_lower_ascii(text);

  for (auto m : all_modes) {
    if (lowered == to_string(m)) {
      return m;
    }
  }
  return unexpected(error::invalid_mode);
}

}  // namespace subscan
