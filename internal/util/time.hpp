#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace tracereplay::util {

/*
  Time utilities — single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration  = Clock::duration;

TimePoint Now();

// Capture timestamps are (seconds, microseconds) since the Unix epoch.
// Returns nullopt when the value does not fit the clock.
std::optional<TimePoint> FromCaptureTime(uint64_t unix_seconds, uint32_t subsec_micros);

// a + b, or nullopt on overflow.
std::optional<TimePoint> CheckedAdd(TimePoint tp, Duration delta);

// a - b clamped at zero.
Duration SaturatingSub(TimePoint a, TimePoint b);

uint64_t ToUnixMicros(TimePoint tp);

} // namespace tracereplay::util
