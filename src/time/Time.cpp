// Repository: avpipe
// Component: Time
// Purpose: Timestamps as integer ticks of a rational time base, with
//          drift-free rescaling between time bases.
// Copyright (c) 2025 RetroVue

#include "avpipe/time/Time.hpp"

#include <cmath>
#include <limits>
#include <sstream>

extern "C" {
#include <libavutil/mathematics.h>
}

#include "avpipe/time/NativeRational.hpp"

namespace avpipe::time {

namespace {

using int128 = __int128;

int64_t SaturateToInt64(int128 v) {
  if (v > static_cast<int128>(std::numeric_limits<int64_t>::max())) {
    return std::numeric_limits<int64_t>::max();
  }
  if (v < static_cast<int128>(std::numeric_limits<int64_t>::min())) {
    return std::numeric_limits<int64_t>::min();
  }
  return static_cast<int64_t>(v);
}

}  // namespace

int64_t RescaleTicks(int64_t ticks, const Rational& from, const Rational& to) {
  if (!from.IsValid() || !to.IsValid() || from == to) return ticks;

  // Components fit in int, so the factors av_rescale_rnd forms from them
  // stay below 2^62 and its 128-bit path is exact.
  const int64_t result = av_rescale_q_rnd(ticks, ToAVRational(from), ToAVRational(to),
                                          AV_ROUND_NEAR_INF);
  // INT64_MIN is FFmpeg's overflow marker; a non-negative input never
  // legitimately produces it.
  if (result == std::numeric_limits<int64_t>::min() && ticks >= 0) {
    return std::numeric_limits<int64_t>::max();
  }
  return result;
}

Time::Time() : value_(std::nullopt), time_base_(kMicrosecondTimeBase) {}

Time::Time(std::optional<int64_t> value, const Rational& time_base)
    : value_(value), time_base_(time_base) {}

util::MediaError Time::FromUnitFraction(int64_t n, int64_t d, Time& out) {
  if (d <= 0 || d > kRationalMax) return util::MediaError::kInvalidTimeBase;
  out = Time(n, Rational(1, d));
  return util::MediaError::kOk;
}

Time Time::FromSeconds(double seconds) {
  const int64_t us = static_cast<int64_t>(
      std::llround(seconds * static_cast<double>(kMicrosecondTimeBase.den)));
  return Time(us, kMicrosecondTimeBase);
}

Time Time::FromNthOfASecond(int64_t n) {
  return Time(1, Rational(1, n));
}

Time Time::FromFrameCount(int64_t frames, const Rational& frame_rate) {
  return Time(frames, frame_rate.Invert());
}

Time Time::Zero() {
  return Time(0, Rational(1, 1));
}

Time Time::Rescale(const Rational& time_base) const {
  if (!value_) return Time(std::nullopt, time_base);
  return Time(RescaleTicks(*value_, time_base_, time_base), time_base);
}

Time Time::operator+(const Time& other) const {
  if (!value_ || !other.value_) return Time(std::nullopt, time_base_);
  const int64_t rhs = RescaleTicks(*other.value_, other.time_base_, time_base_);
  return Time(SaturateToInt64(static_cast<int128>(*value_) + rhs), time_base_);
}

double Time::ToSeconds() const {
  if (!value_ || !time_base_.IsValid()) return 0.0;
  return static_cast<double>(*value_) * time_base_.ToDouble();
}

std::string Time::ToString() const {
  std::ostringstream oss;
  if (value_) {
    oss << *value_;
  } else {
    oss << "none";
  }
  oss << "@" << time_base_.num << "/" << time_base_.den;
  return oss.str();
}

int Time::Compare(const Time& other) const {
  if (!value_ && !other.value_) return 0;
  if (!value_) return -1;
  if (!other.value_) return 1;
  // |value| < 2^63 and both components <= 2^31, so each product < 2^125.
  const int128 lhs = static_cast<int128>(*value_) * time_base_.num * other.time_base_.den;
  const int128 rhs = static_cast<int128>(*other.value_) * other.time_base_.num * time_base_.den;
  if (lhs < rhs) return -1;
  if (lhs > rhs) return 1;
  return 0;
}

TimeStepper::TimeStepper(const Time& start, const Time& step)
    : start_(start.HasValue() ? start : Time(0, start.TimeBase())),
      step_(step.HasValue() ? step : Time(0, step.TimeBase())),
      current_(start_) {}

TimeStepper TimeStepper::ForFrameRate(const Rational& frame_rate) {
  const Rational base = frame_rate.Invert();
  return TimeStepper(Time(0, base), Time(1, base));
}

TimeStepper TimeStepper::AlignedWith(const Time& step) const {
  TimeStepper aligned(current_.Rescale(step.TimeBase()), step);
  return aligned;
}

Time TimeStepper::Advance() {
  const Time value = current_;
  ++steps_;
  const int128 offset = static_cast<int128>(*step_.Value()) * steps_;
  current_ = start_ + Time(SaturateToInt64(offset), step_.TimeBase());
  return value;
}

}  // namespace avpipe::time
