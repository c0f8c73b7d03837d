#include "time.hpp"

#include <limits>

namespace tracereplay::util {

TimePoint Now() {
  return Clock::now();
}

std::optional<TimePoint> FromCaptureTime(uint64_t unix_seconds, uint32_t subsec_micros) {
  using std::chrono::duration_cast;
  using std::chrono::microseconds;

  constexpr auto kMaxSeconds = duration_cast<std::chrono::seconds>(Duration::max()).count();
  if (unix_seconds >= static_cast<uint64_t>(kMaxSeconds)) {
    return std::nullopt;
  }

  auto since_epoch = duration_cast<Duration>(std::chrono::seconds(static_cast<int64_t>(unix_seconds)));
  return CheckedAdd(TimePoint{since_epoch}, duration_cast<Duration>(microseconds(subsec_micros)));
}

std::optional<TimePoint> CheckedAdd(TimePoint tp, Duration delta) {
  const auto base = tp.time_since_epoch().count();
  const auto add  = delta.count();
  using Rep       = Duration::rep;
  if (add > 0 && base > std::numeric_limits<Rep>::max() - add) {
    return std::nullopt;
  }
  if (add < 0 && base < std::numeric_limits<Rep>::min() - add) {
    return std::nullopt;
  }
  return tp + delta;
}

Duration SaturatingSub(TimePoint a, TimePoint b) {
  if (a <= b) {
    return Duration::zero();
  }
  return a - b;
}

uint64_t ToUnixMicros(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

} // namespace tracereplay::util
