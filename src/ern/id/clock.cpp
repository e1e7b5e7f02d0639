#include "ern/id/clock.hpp"

#include <chrono>

namespace ern::id {

auto SystemClock::Now() const -> std::chrono::nanoseconds {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::system_clock::now().time_since_epoch());
}

}  // namespace ern::id
