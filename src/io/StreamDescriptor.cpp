// Repository: avpipe
// Component: StreamDescriptor
// Purpose: Codec parameters, time base and index of one elementary stream,
//          as handed across the demux/mux boundary.
// Copyright (c) 2025 RetroVue

#include "avpipe/io/StreamDescriptor.hpp"

#include <sstream>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
#include <libavutil/pixdesc.h>
}

#include "avpipe/time/NativeRational.hpp"

namespace avpipe::io {

namespace {

using util::MediaError;

std::shared_ptr<const AVCodecParameters> Own(AVCodecParameters* params) {
  return std::shared_ptr<const AVCodecParameters>(params, [](const AVCodecParameters* p) {
    AVCodecParameters* owned = const_cast<AVCodecParameters*>(p);
    avcodec_parameters_free(&owned);
  });
}

}  // namespace

MediaError StreamDescriptor::FromParameters(const AVCodecParameters* params,
                                            const time::Rational& time_base, int index,
                                            StreamDescriptor& out,
                                            const time::Rational& frame_rate) {
  if (!params) return MediaError::kInvalidSettings;
  if (!time_base.IsValid()) return MediaError::kInvalidTimeBase;

  AVCodecParameters* copy = avcodec_parameters_alloc();
  if (!copy) return MediaError::kOutOfMemory;
  int ret = avcodec_parameters_copy(copy, params);
  if (ret < 0) {
    avcodec_parameters_free(&copy);
    return util::MapNativeError(ret, util::NativeContext::kBuffer);
  }

  StreamDescriptor desc;
  desc.params_ = Own(copy);
  desc.time_base_ = time_base;
  desc.frame_rate_ = frame_rate;
  desc.index_ = index;
  out = desc;
  return MediaError::kOk;
}

MediaError StreamDescriptor::FromCodecContext(const AVCodecContext* ctx, int index,
                                              StreamDescriptor& out) {
  if (!ctx) return MediaError::kInvalidSettings;
  AVCodecParameters* params = avcodec_parameters_alloc();
  if (!params) return MediaError::kOutOfMemory;
  int ret = avcodec_parameters_from_context(params, ctx);
  if (ret < 0) {
    avcodec_parameters_free(&params);
    return util::MapNativeError(ret, util::NativeContext::kBuffer);
  }
  const time::Rational time_base = time::FromAVRational(ctx->time_base);
  if (!time_base.IsValid()) {
    avcodec_parameters_free(&params);
    return MediaError::kInvalidTimeBase;
  }

  StreamDescriptor desc;
  desc.params_ = Own(params);
  desc.time_base_ = time_base;
  desc.frame_rate_ = time::FromAVRational(ctx->framerate);
  desc.index_ = index;
  out = desc;
  return MediaError::kOk;
}

MediaError StreamDescriptor::ForVideo(AVCodecID codec_id, AVPixelFormat format, int width,
                                      int height, const time::Rational& time_base,
                                      StreamDescriptor& out) {
  if (width <= 0 || height <= 0) return MediaError::kInvalidSettings;
  if (!time_base.IsValid()) return MediaError::kInvalidTimeBase;
  AVCodecParameters* params = avcodec_parameters_alloc();
  if (!params) return MediaError::kOutOfMemory;
  params->codec_type = AVMEDIA_TYPE_VIDEO;
  params->codec_id = codec_id;
  params->format = format;
  params->width = width;
  params->height = height;

  StreamDescriptor desc;
  desc.params_ = Own(params);
  desc.time_base_ = time_base;
  desc.frame_rate_ = time_base.Invert();
  desc.index_ = 0;
  out = desc;
  return MediaError::kOk;
}

MediaError StreamDescriptor::ForAudio(AVCodecID codec_id, AVSampleFormat format,
                                      int sample_rate, int channels,
                                      const time::Rational& time_base, StreamDescriptor& out) {
  if (sample_rate <= 0 || channels <= 0) return MediaError::kInvalidSettings;
  if (!time_base.IsValid()) return MediaError::kInvalidTimeBase;
  AVCodecParameters* params = avcodec_parameters_alloc();
  if (!params) return MediaError::kOutOfMemory;
  params->codec_type = AVMEDIA_TYPE_AUDIO;
  params->codec_id = codec_id;
  params->format = format;
  params->sample_rate = sample_rate;
  av_channel_layout_default(&params->ch_layout, channels);
  const int bytes_per_sample = av_get_bytes_per_sample(format);
  if (bytes_per_sample > 0) {
    params->block_align = bytes_per_sample * channels;
    params->bits_per_coded_sample = bytes_per_sample * 8;
  }

  StreamDescriptor desc;
  desc.params_ = Own(params);
  desc.time_base_ = time_base;
  desc.index_ = 0;
  out = desc;
  return MediaError::kOk;
}

AVCodecID StreamDescriptor::CodecId() const {
  return params_ ? params_->codec_id : AV_CODEC_ID_NONE;
}

std::string StreamDescriptor::CodecName() const {
  return avcodec_get_name(CodecId());
}

buffer::MediaKind StreamDescriptor::Kind() const {
  if (!params_) return buffer::MediaKind::kUnknown;
  switch (params_->codec_type) {
    case AVMEDIA_TYPE_VIDEO: return buffer::MediaKind::kVideo;
    case AVMEDIA_TYPE_AUDIO: return buffer::MediaKind::kAudio;
    default: return buffer::MediaKind::kUnknown;
  }
}

int StreamDescriptor::Width() const {
  return params_ ? params_->width : 0;
}

int StreamDescriptor::Height() const {
  return params_ ? params_->height : 0;
}

AVPixelFormat StreamDescriptor::PixelFormat() const {
  if (Kind() != buffer::MediaKind::kVideo) return AV_PIX_FMT_NONE;
  return static_cast<AVPixelFormat>(params_->format);
}

int StreamDescriptor::SampleRate() const {
  return params_ ? params_->sample_rate : 0;
}

int StreamDescriptor::Channels() const {
  return params_ ? params_->ch_layout.nb_channels : 0;
}

AVSampleFormat StreamDescriptor::SampleFormat() const {
  if (Kind() != buffer::MediaKind::kAudio) return AV_SAMPLE_FMT_NONE;
  return static_cast<AVSampleFormat>(params_->format);
}

std::string StreamDescriptor::ToString() const {
  std::ostringstream oss;
  oss << "#" << index_ << " " << CodecName() << " " << buffer::MediaKindName(Kind());
  if (Kind() == buffer::MediaKind::kVideo) {
    const char* fmt = av_get_pix_fmt_name(PixelFormat());
    oss << " " << Width() << "x" << Height() << " " << (fmt ? fmt : "none");
  } else if (Kind() == buffer::MediaKind::kAudio) {
    const char* fmt = av_get_sample_fmt_name(SampleFormat());
    oss << " " << SampleRate() << "Hz/" << Channels() << "ch " << (fmt ? fmt : "none");
  }
  oss << " tb=" << time_base_.num << "/" << time_base_.den;
  return oss.str();
}

}  // namespace avpipe::io
