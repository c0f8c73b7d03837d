#include "internal/util/time.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>

namespace {

using tracereplay::util::CheckedAdd;
using tracereplay::util::Duration;
using tracereplay::util::FromCaptureTime;
using tracereplay::util::SaturatingSub;
using tracereplay::util::TimePoint;
using tracereplay::util::ToUnixMicros;

void TestCaptureTimeConverts() {
  auto tp = FromCaptureTime(1700000000, 250);
  assert(tp.has_value());
  assert(ToUnixMicros(*tp) == 1700000000000250ull);

  auto epoch = FromCaptureTime(0, 0);
  assert(epoch && ToUnixMicros(*epoch) == 0);
}

void TestCaptureTimeOutOfRange() {
  assert(!FromCaptureTime(std::numeric_limits<uint64_t>::max(), 0).has_value());
}

void TestCheckedArithmetic() {
  const TimePoint max{Duration::max()};
  assert(!CheckedAdd(max, Duration(1)).has_value());
  assert(CheckedAdd(max, Duration::zero()) == max);

  const TimePoint base{std::chrono::seconds(10)};
  const TimePoint later{std::chrono::seconds(12)};
  assert(SaturatingSub(later, base) == std::chrono::seconds(2));
  assert(SaturatingSub(base, later) == Duration::zero());
}

} // namespace

int main() {
  TestCaptureTimeConverts();
  TestCaptureTimeOutOfRange();
  TestCheckedArithmetic();

  std::cout << "trace_replay_unit_time: pass\n";
  return 0;
}
