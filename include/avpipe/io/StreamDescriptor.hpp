// Repository: avpipe
// Component: StreamDescriptor
// Purpose: Codec parameters, time base and index of one elementary stream,
//          as handed across the demux/mux boundary.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_IO_STREAM_DESCRIPTOR_HPP_
#define AVPIPE_IO_STREAM_DESCRIPTOR_HPP_

#include <memory>
#include <string>

extern "C" {
#include <libavcodec/codec_id.h>
#include <libavutil/pixfmt.h>
#include <libavutil/samplefmt.h>
}

#include "avpipe/buffer/Frame.hpp"
#include "avpipe/time/Rational.hpp"
#include "avpipe/util/MediaError.hpp"

struct AVCodecParameters;
struct AVCodecContext;

namespace avpipe::io {

// Immutable once built. Copies share one private AVCodecParameters copy,
// so a descriptor never aliases a demuxer's or encoder's live parameters.
class StreamDescriptor {
 public:
  StreamDescriptor() = default;

  // Deep-copies `params`.
  static util::MediaError FromParameters(const AVCodecParameters* params,
                                         const time::Rational& time_base, int index,
                                         StreamDescriptor& out,
                                         const time::Rational& frame_rate = time::Rational());

  // Parameters of an opened codec context (encoder output side).
  static util::MediaError FromCodecContext(const AVCodecContext* ctx, int index,
                                           StreamDescriptor& out);

  // Descriptors for streams with no container behind them, e.g. packets
  // holding raw pictures (AV_CODEC_ID_RAWVIDEO) or PCM samples.
  static util::MediaError ForVideo(AVCodecID codec_id, AVPixelFormat format, int width,
                                   int height, const time::Rational& time_base,
                                   StreamDescriptor& out);
  static util::MediaError ForAudio(AVCodecID codec_id, AVSampleFormat format, int sample_rate,
                                   int channels, const time::Rational& time_base,
                                   StreamDescriptor& out);

  bool IsValid() const { return params_ != nullptr; }

  AVCodecID CodecId() const;
  std::string CodecName() const;
  buffer::MediaKind Kind() const;

  int Width() const;
  int Height() const;
  AVPixelFormat PixelFormat() const;

  int SampleRate() const;
  int Channels() const;
  AVSampleFormat SampleFormat() const;

  const time::Rational& TimeBase() const { return time_base_; }
  // Nominal frame rate when known (video), else invalid.
  const time::Rational& FrameRate() const { return frame_rate_; }
  int Index() const { return index_; }

  const AVCodecParameters* Parameters() const { return params_.get(); }

  std::string ToString() const;

 private:
  std::shared_ptr<const AVCodecParameters> params_;
  time::Rational time_base_;
  time::Rational frame_rate_;
  int index_ = -1;
};

}  // namespace avpipe::io

#endif  // AVPIPE_IO_STREAM_DESCRIPTOR_HPP_
