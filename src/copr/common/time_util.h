#ifndef COPR_COMMON_TIME_UTIL_H_
#define COPR_COMMON_TIME_UTIL_H_

#include <time.h>

#include <chrono>

namespace copr {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Monotonic clock backed by CLOCK_MONOTONIC_COARSE. Resolution is a few
// milliseconds.
struct CoarseMonotonicClock {
  using duration = std::chrono::nanoseconds;
  using rep = duration::rep;
  using period = duration::period;
  using time_point = std::chrono::time_point<CoarseMonotonicClock>;
  static constexpr bool is_steady = true;

  static time_point now() noexcept {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC_COARSE, &ts);
    return time_point(std::chrono::seconds(ts.tv_sec) +
                      std::chrono::nanoseconds(ts.tv_nsec));
  }
};

using CoarseTimePoint = CoarseMonotonicClock::time_point;

template <typename Duration>
inline long ToMillis(Duration d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

}  // namespace copr

#endif  // COPR_COMMON_TIME_UTIL_H_
