#pragma once

#include <algorithm>
#include <chrono>

namespace monitor::support {

using Millis = std::chrono::milliseconds;

using SteadyClock = std::chrono::steady_clock;

// Longer waits are split into several futex waits
inline constexpr Millis kMaxWaitSlice = std::chrono::hours(24);

// Futex timeouts are whole millis, never round a pending wait down to zero
template <typename Duration>
inline Millis CeilMillis(Duration dur) {
  return std::clamp(std::chrono::ceil<Millis>(dur), Millis{1}, kMaxWaitSlice);
}

// now + timeout, saturated at time_point::max() for "forever" timeouts
template <typename Rep, typename Period>
SteadyClock::time_point DeadlineAfter(
    std::chrono::duration<Rep, Period> timeout) {
  using Timeout = std::chrono::duration<Rep, Period>;

  const auto now = SteadyClock::now();

  if (timeout <= Timeout::zero()) {
    return now;
  }

  // Compared in the units of timeout, converting it could overflow
  const auto headroom = std::chrono::duration_cast<Timeout>(
      SteadyClock::time_point::max() - now);

  if (timeout >= headroom) {
    return SteadyClock::time_point::max();
  }

  return now + std::chrono::duration_cast<SteadyClock::duration>(timeout);
}

}  // namespace monitor::support
