// Repository: avpipe
// Component: Frame
// Purpose: Owning wrapper around a reference-counted AVFrame with
//          copy-on-write plane access.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_BUFFER_FRAME_HPP_
#define AVPIPE_BUFFER_FRAME_HPP_

#include <cstdint>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/pixfmt.h>
#include <libavutil/samplefmt.h>
}

#include "avpipe/time/Rational.hpp"
#include "avpipe/time/Time.hpp"
#include "avpipe/util/MediaError.hpp"

struct AVFrame;

namespace avpipe::buffer {

enum class MediaKind {
  kUnknown,
  kVideo,
  kAudio,
};

const char* MediaKindName(MediaKind kind);

// Read-only view of one plane. For video a plane has `rows` rows of
// `row_bytes` meaningful bytes, `stride` bytes apart. Audio planes are a
// single row.
struct PlaneView {
  const uint8_t* data = nullptr;
  int stride = 0;
  int row_bytes = 0;
  int rows = 0;
};

struct MutablePlaneView {
  uint8_t* data = nullptr;
  int stride = 0;
  int row_bytes = 0;
  int rows = 0;
};

// Frame holds one reference to a native AVFrame: decoded pixels or samples
// plus a presentation timestamp in TimeBase() units.
//
// Ownership:
// - Move-only; Clone() takes another native reference to the same buffers.
// - Plane() never copies. WritablePlane() and MakeWritable() first make the
//   buffers private when they are shared (copy-on-write), so writes through
//   one Frame are never visible through another.
// - The destructor releases the reference exactly once.
class Frame {
 public:
  Frame() noexcept = default;
  ~Frame();

  Frame(const Frame&) = delete;
  Frame& operator=(const Frame&) = delete;
  Frame(Frame&& other) noexcept;
  Frame& operator=(Frame&& other) noexcept;

  // Takes ownership of `raw_frame` (must come from av_frame_alloc).
  static Frame AttachRawFrame(AVFrame* raw_frame, MediaKind kind,
                              const time::Rational& time_base);

  // Zero-filled video frame. Invalid geometry or format → kInvalidBuffer,
  // allocation failure → kOutOfMemory.
  static util::MediaError AllocateVideo(AVPixelFormat format, int width, int height,
                                        Frame& out);

  static util::MediaError AllocateAudio(AVSampleFormat format, int sample_rate,
                                        const AVChannelLayout& layout, int samples,
                                        Frame& out);
  // Default channel layout for `channels`.
  static util::MediaError AllocateAudio(AVSampleFormat format, int sample_rate,
                                        int channels, int samples, Frame& out);

  util::MediaError Clone(Frame& out) const;

  bool HasNative() const { return raw_frame_ != nullptr; }
  MediaKind Kind() const { return kind_; }

  int Width() const;
  int Height() const;
  AVPixelFormat PixelFormat() const;

  AVSampleFormat SampleFormat() const;
  int SampleRate() const;
  int Channels() const;
  int SampleCount() const;

  int PlaneCount() const;
  PlaneView Plane(int index) const;
  util::MediaError WritablePlane(int index, MutablePlaneView& out);

  bool IsWritable() const;
  util::MediaError MakeWritable();

  // Native refcount of the first backing buffer; 0 without one.
  int ReferenceCount() const;

  time::Time Pts() const;
  // Aligned with TimeBase().
  void SetPts(const time::Time& pts);
  const time::Rational& TimeBase() const { return time_base_; }
  // Re-expresses the PTS in `time_base`.
  void RescaleTs(const time::Rational& time_base);

  // Checks that the native frame describes plane pointers, strides and
  // sizes that lie entirely inside its own reference-counted buffers.
  // kInvalidBuffer otherwise.
  util::MediaError Validate() const;

  AVFrame* RawFramePtr() { return raw_frame_; }
  const AVFrame* RawFramePtr() const { return raw_frame_; }

 private:
  Frame(AVFrame* raw_frame, MediaKind kind, const time::Rational& time_base) noexcept;
  void Reset() noexcept;

  AVFrame* raw_frame_ = nullptr;
  MediaKind kind_ = MediaKind::kUnknown;
  time::Rational time_base_;
};

}  // namespace avpipe::buffer

#endif  // AVPIPE_BUFFER_FRAME_HPP_
