// Repository: avpipe
// Component: Time
// Purpose: Timestamps as integer ticks of a rational time base, with
//          drift-free rescaling between time bases.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_TIME_TIME_HPP_
#define AVPIPE_TIME_TIME_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "avpipe/time/Rational.hpp"
#include "avpipe/util/MediaError.hpp"

namespace avpipe::time {

// Rescales a tick count from one time base to another, rounding to the
// nearest tick with halves away from zero (av_rescale_q_rnd with
// AV_ROUND_NEAR_INF). A result beyond the int64 range saturates. Monotonic
// in `ticks`; the identity when `from == to` or either base is invalid.
int64_t RescaleTicks(int64_t ticks, const Rational& from, const Rational& to);

// Time is an immutable instant or duration: `value` ticks of `time_base`
// seconds each. A Time without a value stands for the native "no
// timestamp" marker and stays valueless through every operation.
class Time {
 public:
  // Valueless, microsecond base.
  Time();
  Time(std::optional<int64_t> value, const Rational& time_base);

  // n/d seconds, stored as n ticks of 1/d. d <= 0 or d > kRationalMax →
  // kInvalidTimeBase.
  static util::MediaError FromUnitFraction(int64_t n, int64_t d, Time& out);

  // Wall-clock seconds at microsecond precision.
  static Time FromSeconds(double seconds);

  // One 1/n-th of a second (a single tick of base 1/n).
  static Time FromNthOfASecond(int64_t n);

  // Start instant of frame `frames` at `frame_rate`, in base 1/frame_rate.
  static Time FromFrameCount(int64_t frames, const Rational& frame_rate);

  static Time Zero();

  bool HasValue() const { return value_.has_value(); }
  const std::optional<int64_t>& Value() const { return value_; }
  int64_t ValueOr(int64_t fallback) const { return value_.value_or(fallback); }
  const Rational& TimeBase() const { return time_base_; }

  // Nearest-tick equivalent in `time_base`.
  Time Rescale(const Rational& time_base) const;

  // Same as Rescale; reads better at call sites that align a caller-side
  // timestamp with a codec or stream time base.
  Time AlignedWith(const Rational& time_base) const { return Rescale(time_base); }

  // Sum expressed in this Time's base. Valueless if either side is.
  Time operator+(const Time& other) const;

  double ToSeconds() const;

  // "<value>@<num>/<den>" or "none@<num>/<den>".
  std::string ToString() const;

  // Exact comparison across time bases. Valueless Times compare equal to
  // each other and less than any Time with a value.
  int Compare(const Time& other) const;

  bool operator==(const Time& other) const { return Compare(other) == 0; }
  bool operator!=(const Time& other) const { return Compare(other) != 0; }
  bool operator<(const Time& other) const { return Compare(other) < 0; }
  bool operator<=(const Time& other) const { return Compare(other) <= 0; }
  bool operator>(const Time& other) const { return Compare(other) > 0; }
  bool operator>=(const Time& other) const { return Compare(other) >= 0; }

 private:
  std::optional<int64_t> value_;
  Rational time_base_;
};

// TimeStepper produces successive Times one fixed interval apart, for
// timestamping synthetically generated frames. Purely additive: the n-th
// value is start + n * step computed in the start's base, so there is no
// accumulated rounding however long it runs.
class TimeStepper {
 public:
  TimeStepper(const Time& start, const Time& step);

  // Steps at `frame_rate` starting from zero, in base 1/frame_rate.
  static TimeStepper ForFrameRate(const Rational& frame_rate);

  // Re-expresses the stepper in the base of `step` (align_with).
  TimeStepper AlignedWith(const Time& step) const;

  const Time& Current() const { return current_; }

  // Returns the current value and moves to the next one.
  Time Advance();

  int64_t StepsTaken() const { return steps_; }

 private:
  Time start_;
  Time step_;
  Time current_;
  int64_t steps_ = 0;
};

}  // namespace avpipe::time

#endif  // AVPIPE_TIME_TIME_HPP_
