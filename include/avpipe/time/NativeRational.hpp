// Repository: avpipe
// Component: NativeRational
// Purpose: Conversions between avpipe::time::Rational and FFmpeg AVRational.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_TIME_NATIVE_RATIONAL_HPP_
#define AVPIPE_TIME_NATIVE_RATIONAL_HPP_

#include <cstdint>
#include <limits>

extern "C" {
#include <libavutil/rational.h>
}

#include "avpipe/time/Rational.hpp"

namespace avpipe::time {

inline Rational FromAVRational(const AVRational& r) {
  return Rational(r.num, r.den);
}

// Components beyond int range cannot be represented natively; they map to
// the invalid 0/1 that FFmpeg also uses for "unknown".
inline AVRational ToAVRational(const Rational& r) {
  constexpr int64_t kMax = std::numeric_limits<int>::max();
  if (!r.IsValid() || r.num > kMax || r.den > kMax) return AVRational{0, 1};
  return AVRational{static_cast<int>(r.num), static_cast<int>(r.den)};
}

}  // namespace avpipe::time

#endif  // AVPIPE_TIME_NATIVE_RATIONAL_HPP_
