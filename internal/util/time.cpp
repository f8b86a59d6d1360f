#include "time.hpp"

namespace reconciler::util {

TimePoint Now() {
  return Clock::now();
}

std::chrono::milliseconds MillisOr(uint64_t value_ms, std::chrono::milliseconds fallback) {
  if (value_ms == 0) return fallback;
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value_ms));
}

} // namespace reconciler::util
