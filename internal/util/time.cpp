#include "time.hpp"

#include <chrono>

namespace vesting::util {

std::uint64_t SystemClock::NowSeconds() const {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace vesting::util
