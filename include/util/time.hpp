#pragma once

#include <chrono>
#include <cstdint>

namespace timeutil {

// Wall-clock stamp written at the start of each journal line
inline std::int64_t EpochMillisUtc() {
  using clock = std::chrono::system_clock;
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             clock::now().time_since_epoch())
      .count();
}

// Monotonic milliseconds for measuring job latency
inline std::int64_t SteadyMillis() {
  using clock = std::chrono::steady_clock;
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             clock::now().time_since_epoch())
      .count();
}

} // namespace timeutil
