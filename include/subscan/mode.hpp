#pragma once

#include <subscan/result.hpp>

#include <array>
#include <string_view>

namespace subscan {

/// Aggressiveness tier. Ordered: normal < medium < ultimate.
///
/// The mode controls both how widely the generator expands the name space and the
/// concurrency/timeout profile the verifier runs with.
enum class mode {
  normal,
  medium,
  ultimate,
};

inline constexpr std::array<mode, 3> all_modes{mode::normal, mode::medium, mode::ultimate};

auto to_string(mode m) noexcept -> std::string_view;

/// Parse one of the literal tokens `normal`, `medium`, `ultimate` (case-insensitive).
auto parse_mode(std::string_view text) -> io_result<mode>;

}  // namespace subscan
