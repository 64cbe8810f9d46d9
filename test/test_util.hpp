#pragma once

#include <sys/resource.h>
#include <unistd.h>

#include <cstddef>
#include <fstream>

namespace subscan {

/// Caps the address space of the calling process at its current size plus `headroom`,
/// so only a handful of further thread stacks can be mapped. Use inside a death-test
/// child: the limit is process wide and cannot be raised again.
inline auto cap_address_space(std::size_t headroom) -> bool {
  long pages = 0;
  {
    std::ifstream statm{"/proc/self/statm"};
    if (!(statm >> pages)) {
      return false;
    }
  }
  auto const page_size = ::sysconf(_SC_PAGESIZE);
  if (pages <= 0 || page_size <= 0) {
    return false;
  }

  rlimit lim{};
  lim.rlim_cur = static_cast<rlim_t>(pages) * static_cast<rlim_t>(page_size) + headroom;
  lim.rlim_max = lim.rlim_cur;
  return ::setrlimit(RLIMIT_AS, &lim) == 0;
}

}  // namespace subscan
