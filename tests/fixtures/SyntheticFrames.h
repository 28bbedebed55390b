// Repository: avpipe
// Component: Test Fixtures
// Purpose: Deterministic synthetic video and audio frames, and byte-level
//          frame comparison, for contract tests. No media files needed.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_TESTS_FIXTURES_SYNTHETIC_FRAMES_H_
#define AVPIPE_TESTS_FIXTURES_SYNTHETIC_FRAMES_H_

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "avpipe/buffer/Frame.hpp"
#include "avpipe/time/Rational.hpp"
#include "avpipe/time/Time.hpp"
#include "avpipe/util/MediaError.hpp"

namespace avpipe::tests::fixtures {

// Moving gradient: byte (x, y) of plane p in frame `index` is a fixed
// function of all four, so any two runs produce identical frames.
inline util::MediaError MakeGradientFrame(AVPixelFormat format, int width, int height,
                                          int64_t index, buffer::Frame& out) {
  buffer::Frame frame;
  util::MediaError err = buffer::Frame::AllocateVideo(format, width, height, frame);
  if (err != util::MediaError::kOk) return err;

  for (int p = 0; p < frame.PlaneCount(); ++p) {
    buffer::MutablePlaneView plane;
    err = frame.WritablePlane(p, plane);
    if (err != util::MediaError::kOk) return err;
    for (int y = 0; y < plane.rows; ++y) {
      uint8_t* row = plane.data + static_cast<ptrdiff_t>(y) * plane.stride;
      for (int x = 0; x < plane.row_bytes; ++x) {
        row[x] = static_cast<uint8_t>((x * 3 + y * 5 + index * 7 + p * 61) & 0xFF);
      }
    }
  }
  frame.SetPts(time::Time(index, frame.TimeBase()));
  out = std::move(frame);
  return util::MediaError::kOk;
}

// Interleaved signed 16-bit ramp. Sample i of channel c in frame `index`.
inline util::MediaError MakeRampAudioS16(int sample_rate, int channels, int samples,
                                         int64_t index, buffer::Frame& out) {
  buffer::Frame frame;
  util::MediaError err =
      buffer::Frame::AllocateAudio(AV_SAMPLE_FMT_S16, sample_rate, channels, samples, frame);
  if (err != util::MediaError::kOk) return err;

  buffer::MutablePlaneView plane;
  err = frame.WritablePlane(0, plane);
  if (err != util::MediaError::kOk) return err;
  auto* pcm = reinterpret_cast<int16_t*>(plane.data);
  for (int i = 0; i < samples; ++i) {
    for (int c = 0; c < channels; ++c) {
      const int64_t n = index * samples + i;
      pcm[i * channels + c] = static_cast<int16_t>(((n * 37 + c * 1000) % 20000) - 10000);
    }
  }
  frame.SetPts(time::Time(index * samples, time::Rational(1, sample_rate)));
  out = std::move(frame);
  return util::MediaError::kOk;
}

// Compares the meaningful bytes of every plane; padding is ignored.
inline ::testing::AssertionResult PlanesEqual(const buffer::Frame& a, const buffer::Frame& b) {
  if (a.PlaneCount() != b.PlaneCount()) {
    return ::testing::AssertionFailure()
           << "plane count " << a.PlaneCount() << " vs " << b.PlaneCount();
  }
  for (int p = 0; p < a.PlaneCount(); ++p) {
    const buffer::PlaneView pa = a.Plane(p);
    const buffer::PlaneView pb = b.Plane(p);
    if (pa.rows != pb.rows || pa.row_bytes != pb.row_bytes) {
      return ::testing::AssertionFailure()
             << "plane " << p << " geometry " << pa.row_bytes << "x" << pa.rows << " vs "
             << pb.row_bytes << "x" << pb.rows;
    }
    for (int y = 0; y < pa.rows; ++y) {
      const uint8_t* ra = pa.data + static_cast<ptrdiff_t>(y) * pa.stride;
      const uint8_t* rb = pb.data + static_cast<ptrdiff_t>(y) * pb.stride;
      if (std::memcmp(ra, rb, static_cast<size_t>(pa.row_bytes)) != 0) {
        return ::testing::AssertionFailure() << "plane " << p << " differs at row " << y;
      }
    }
  }
  return ::testing::AssertionSuccess();
}

// Unique path under the system temp directory; removed by ScopedTempFile.
class ScopedTempFile {
 public:
  explicit ScopedTempFile(const std::string& suffix) {
    const ::testing::TestInfo* info =
        ::testing::UnitTest::GetInstance()->current_test_info();
    path_ = ::testing::TempDir() + "avpipe_" + (info ? info->name() : "test") + suffix;
    std::remove(path_.c_str());
  }
  ~ScopedTempFile() { std::remove(path_.c_str()); }

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace avpipe::tests::fixtures

#endif  // AVPIPE_TESTS_FIXTURES_SYNTHETIC_FRAMES_H_
