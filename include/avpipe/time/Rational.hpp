// Repository: avpipe
// Component: Rational
// Purpose: Exact rational value used for time bases and frame rates.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_TIME_RATIONAL_HPP_
#define AVPIPE_TIME_RATIONAL_HPP_

#include <cstdint>

namespace avpipe::time {

// Largest component a Rational may carry: FFmpeg's AVRational holds ints.
constexpr int64_t kRationalMax = 2147483647;

constexpr int64_t RationalAbs64(int64_t v) { return v < 0 ? -v : v; }

constexpr int64_t RationalGcd64(int64_t a, int64_t b) {
  a = RationalAbs64(a);
  b = RationalAbs64(b);
  while (b != 0) {
    const int64_t t = a % b;
    a = b;
    b = t;
  }
  return a == 0 ? 1 : a;
}

// Rational holds a strictly positive num/den pair in lowest terms, each at
// most kRationalMax. Anything else (zero or negative denominator,
// non-positive numerator, a reduced component beyond the int range)
// normalizes to the invalid value 0/1; IsValid() reports which one it is.
// Time bases (seconds per tick) and frame rates (frames per second) are both
// Rationals.
struct Rational {
  int64_t num;
  int64_t den;

  constexpr Rational(int64_t n = 0, int64_t d = 1) : num(n), den(d) {
    NormalizeInPlace();
  }

  constexpr bool IsValid() const { return num > 0 && den > 0; }

  constexpr void NormalizeInPlace() {
    if (den == 0 || den == INT64_MIN || num == INT64_MIN) {
      num = 0;
      den = 1;
      return;
    }
    if (den < 0) {
      den = -den;
      num = -num;
    }
    if (num <= 0 || den <= 0) {
      num = 0;
      den = 1;
      return;
    }
    const int64_t g = RationalGcd64(num, den);
    num /= g;
    den /= g;
    if (num > kRationalMax || den > kRationalMax) {
      num = 0;
      den = 1;
    }
  }

  // 1/25 fps → 25/1 time base and back.
  constexpr Rational Invert() const {
    return IsValid() ? Rational(den, num) : Rational();
  }

  constexpr double ToDouble() const {
    return static_cast<double>(num) / static_cast<double>(den);
  }

  constexpr bool operator==(const Rational& other) const {
    return num == other.num && den == other.den;
  }
  constexpr bool operator!=(const Rational& other) const {
    return !(*this == other);
  }
};

constexpr Rational kMicrosecondTimeBase{1, 1000000};
constexpr Rational kMpegTsTimeBase{1, 90000};

constexpr Rational FPS_23976{24000, 1001};
constexpr Rational FPS_2997{30000, 1001};
constexpr Rational FPS_5994{60000, 1001};
constexpr Rational FPS_24{24, 1};
constexpr Rational FPS_25{25, 1};
constexpr Rational FPS_30{30, 1};
constexpr Rational FPS_60{60, 1};

}  // namespace avpipe::time

#endif  // AVPIPE_TIME_RATIONAL_HPP_
