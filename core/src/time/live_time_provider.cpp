#include "evstream/time/live_time_provider.hpp"

#include <chrono>

namespace evstream {

// -----------------------------------------------------------------------------
// now_us(): delegate to system_clock and convert to epoch microseconds
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_us() const {
  auto duration = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::microseconds>(duration)
      .count();
}

}  // namespace evstream
