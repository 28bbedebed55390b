// Repository: avpipe
// Component: FrameConverter
// Purpose: Pixel format / dimension conversion (libswscale) and sample
//          format / channel layout conversion (libswresample) of Frames.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_CONVERT_FRAME_CONVERTER_HPP_
#define AVPIPE_CONVERT_FRAME_CONVERTER_HPP_

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/pixfmt.h>
#include <libavutil/samplefmt.h>
}

#include "avpipe/buffer/Frame.hpp"
#include "avpipe/util/MediaError.hpp"

struct SwsContext;
struct SwrContext;

namespace avpipe::convert {

// Requested video output. AV_PIX_FMT_NONE or a zero dimension keeps the
// source's value.
struct VideoTarget {
  AVPixelFormat pixel_format = AV_PIX_FMT_NONE;
  int width = 0;
  int height = 0;
};

// Requested audio output. The sample rate is never changed.
// AV_SAMPLE_FMT_NONE or channels == 0 keeps the source's value.
struct AudioTarget {
  AVSampleFormat sample_format = AV_SAMPLE_FMT_NONE;
  int channels = 0;
};

// FrameConverter produces a new Frame in a requested format from a source
// Frame that it only reads. The result carries the source PTS and time base
// unchanged. Scaling uses bit-exact flags so a given (format, dimension)
// pair always yields the same bytes.
//
// Scaler and resampler contexts are cached and rebuilt when the source or
// target changes. An instance is not thread-safe; use one per thread.
class FrameConverter {
 public:
  FrameConverter() = default;
  ~FrameConverter();

  FrameConverter(const FrameConverter&) = delete;
  FrameConverter& operator=(const FrameConverter&) = delete;

  util::MediaError Convert(const buffer::Frame& source, const VideoTarget& target,
                           buffer::Frame& out);

  util::MediaError Convert(const buffer::Frame& source, const AudioTarget& target,
                           buffer::Frame& out);

  // True when libswscale can read `source` and write `target`.
  static bool IsSupported(AVPixelFormat source, AVPixelFormat target);

 private:
  util::MediaError EnsureScaler(AVPixelFormat src_fmt, int src_w, int src_h,
                                AVPixelFormat dst_fmt, int dst_w, int dst_h);
  util::MediaError EnsureResampler(AVSampleFormat src_fmt, const AVChannelLayout& src_layout,
                                   AVSampleFormat dst_fmt, const AVChannelLayout& dst_layout,
                                   int sample_rate);
  void FreeScaler();
  void FreeResampler();

  SwsContext* sws_ctx_ = nullptr;
  AVPixelFormat sws_src_fmt_ = AV_PIX_FMT_NONE;
  AVPixelFormat sws_dst_fmt_ = AV_PIX_FMT_NONE;
  int sws_src_w_ = 0;
  int sws_src_h_ = 0;
  int sws_dst_w_ = 0;
  int sws_dst_h_ = 0;

  SwrContext* swr_ctx_ = nullptr;
  AVSampleFormat swr_src_fmt_ = AV_SAMPLE_FMT_NONE;
  AVSampleFormat swr_dst_fmt_ = AV_SAMPLE_FMT_NONE;
  AVChannelLayout swr_src_layout_{};
  AVChannelLayout swr_dst_layout_{};
  int swr_rate_ = 0;
};

}  // namespace avpipe::convert

#endif  // AVPIPE_CONVERT_FRAME_CONVERTER_HPP_
