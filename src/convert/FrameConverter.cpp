// Repository: avpipe
// Component: FrameConverter
// Purpose: Pixel format / dimension conversion (libswscale) and sample
//          format / channel layout conversion (libswresample) of Frames.
// Copyright (c) 2025 RetroVue

#include "avpipe/convert/FrameConverter.hpp"

#include <cerrno>
#include <sstream>
#include <utility>

extern "C" {
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/pixdesc.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

#include "avpipe/util/Logger.hpp"

namespace avpipe::convert {

namespace {

using util::MediaError;

constexpr int kScalerFlags = SWS_BICUBIC | SWS_BITEXACT | SWS_ACCURATE_RND;

const char* PixFmtName(AVPixelFormat fmt) {
  const char* name = av_get_pix_fmt_name(fmt);
  return name ? name : "none";
}

const char* SampleFmtName(AVSampleFormat fmt) {
  const char* name = av_get_sample_fmt_name(fmt);
  return name ? name : "none";
}

// Output carries the source's timestamp, time base and frame properties.
MediaError CopyProps(const buffer::Frame& source, buffer::Frame& out) {
  out.RescaleTs(source.TimeBase());
  int ret = av_frame_copy_props(out.RawFramePtr(), source.RawFramePtr());
  if (ret < 0) return util::MapNativeError(ret, util::NativeContext::kBuffer);
  out.SetPts(source.Pts());
  return MediaError::kOk;
}

}  // namespace

FrameConverter::~FrameConverter() {
  FreeScaler();
  FreeResampler();
}

void FrameConverter::FreeScaler() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
}

void FrameConverter::FreeResampler() {
  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }
  av_channel_layout_uninit(&swr_src_layout_);
  av_channel_layout_uninit(&swr_dst_layout_);
}

bool FrameConverter::IsSupported(AVPixelFormat source, AVPixelFormat target) {
  return sws_isSupportedInput(source) > 0 && sws_isSupportedOutput(target) > 0;
}

MediaError FrameConverter::EnsureScaler(AVPixelFormat src_fmt, int src_w, int src_h,
                                        AVPixelFormat dst_fmt, int dst_w, int dst_h) {
  if (sws_ctx_ && sws_src_fmt_ == src_fmt && sws_src_w_ == src_w && sws_src_h_ == src_h &&
      sws_dst_fmt_ == dst_fmt && sws_dst_w_ == dst_w && sws_dst_h_ == dst_h) {
    return MediaError::kOk;
  }
  FreeScaler();

  sws_ctx_ = sws_getContext(src_w, src_h, src_fmt, dst_w, dst_h, dst_fmt,
                            kScalerFlags, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    std::ostringstream oss;
    oss << "[FrameConverter] Failed to create scaler context " << PixFmtName(src_fmt) << " "
        << src_w << "x" << src_h << " -> " << PixFmtName(dst_fmt) << " " << dst_w << "x"
        << dst_h;
    util::Logger::Error(oss.str());
    return MediaError::kUnsupportedConversion;
  }
  sws_src_fmt_ = src_fmt;
  sws_src_w_ = src_w;
  sws_src_h_ = src_h;
  sws_dst_fmt_ = dst_fmt;
  sws_dst_w_ = dst_w;
  sws_dst_h_ = dst_h;
  return MediaError::kOk;
}

MediaError FrameConverter::Convert(const buffer::Frame& source, const VideoTarget& target,
                                   buffer::Frame& out) {
  if (source.Kind() != buffer::MediaKind::kVideo || source.Validate() != MediaError::kOk) {
    return MediaError::kInvalidBuffer;
  }
  const AVPixelFormat src_fmt = source.PixelFormat();
  const int src_w = source.Width();
  const int src_h = source.Height();
  const AVPixelFormat dst_fmt =
      target.pixel_format == AV_PIX_FMT_NONE ? src_fmt : target.pixel_format;
  const int dst_w = target.width > 0 ? target.width : src_w;
  const int dst_h = target.height > 0 ? target.height : src_h;

  if (!IsSupported(src_fmt, dst_fmt)) {
    std::ostringstream oss;
    oss << "[FrameConverter] Unsupported conversion " << PixFmtName(src_fmt) << " -> "
        << PixFmtName(dst_fmt);
    util::Logger::Warn(oss.str());
    return MediaError::kUnsupportedConversion;
  }

  buffer::Frame result;
  MediaError err = buffer::Frame::AllocateVideo(dst_fmt, dst_w, dst_h, result);
  if (err != MediaError::kOk) return err;

  if (src_fmt == dst_fmt && src_w == dst_w && src_h == dst_h) {
    int ret = av_frame_copy(result.RawFramePtr(), source.RawFramePtr());
    if (ret < 0) return util::MapNativeError(ret, util::NativeContext::kConvert);
  } else {
    err = EnsureScaler(src_fmt, src_w, src_h, dst_fmt, dst_w, dst_h);
    if (err != MediaError::kOk) return err;

    const AVFrame* src = source.RawFramePtr();
    AVFrame* dst = result.RawFramePtr();
    int ret = sws_scale(sws_ctx_, src->data, src->linesize, 0, src_h, dst->data, dst->linesize);
    if (ret < 0) {
      util::Logger::Error("[FrameConverter] sws_scale failed: " + util::NativeErrorString(ret));
      return util::MapNativeError(ret, util::NativeContext::kConvert);
    }
    if (ret != dst_h) {
      std::ostringstream oss;
      oss << "[FrameConverter] sws_scale wrote " << ret << " of " << dst_h << " rows";
      util::Logger::Error(oss.str());
      return MediaError::kInvalidBuffer;
    }
  }

  err = CopyProps(source, result);
  if (err != MediaError::kOk) return err;
  out = std::move(result);
  return MediaError::kOk;
}

MediaError FrameConverter::EnsureResampler(AVSampleFormat src_fmt,
                                           const AVChannelLayout& src_layout,
                                           AVSampleFormat dst_fmt,
                                           const AVChannelLayout& dst_layout,
                                           int sample_rate) {
  if (swr_ctx_ && swr_src_fmt_ == src_fmt && swr_dst_fmt_ == dst_fmt &&
      swr_rate_ == sample_rate &&
      av_channel_layout_compare(&swr_src_layout_, &src_layout) == 0 &&
      av_channel_layout_compare(&swr_dst_layout_, &dst_layout) == 0) {
    return MediaError::kOk;
  }

  if (swr_ctx_) {
    std::ostringstream oss;
    oss << "[FrameConverter] Source audio changed, rebuilding resampler: "
        << SampleFmtName(src_fmt) << "/" << src_layout.nb_channels << "ch -> "
        << SampleFmtName(dst_fmt) << "/" << dst_layout.nb_channels << "ch";
    util::Logger::Debug(oss.str());
  }
  FreeResampler();

  ::SwrContext* ctx = nullptr;
  int ret = swr_alloc_set_opts2(&ctx, &dst_layout, dst_fmt, sample_rate,
                                &src_layout, src_fmt, sample_rate, 0, nullptr);
  if (ret < 0 || !ctx) {
    if (ctx) swr_free(&ctx);
    util::Logger::Error("[FrameConverter] Failed to allocate SwrContext: " +
                        util::NativeErrorString(ret < 0 ? ret : AVERROR(ENOMEM)));
    return ret < 0 ? util::MapNativeError(ret, util::NativeContext::kConvert)
                   : MediaError::kOutOfMemory;
  }
  ret = swr_init(ctx);
  if (ret < 0) {
    util::Logger::Error("[FrameConverter] Failed to init SwrContext: " +
                        util::NativeErrorString(ret));
    swr_free(&ctx);
    return util::MapNativeError(ret, util::NativeContext::kConvert);
  }

  if (av_channel_layout_copy(&swr_src_layout_, &src_layout) < 0 ||
      av_channel_layout_copy(&swr_dst_layout_, &dst_layout) < 0) {
    swr_free(&ctx);
    FreeResampler();
    return MediaError::kOutOfMemory;
  }
  swr_ctx_ = ctx;
  swr_src_fmt_ = src_fmt;
  swr_dst_fmt_ = dst_fmt;
  swr_rate_ = sample_rate;
  return MediaError::kOk;
}

MediaError FrameConverter::Convert(const buffer::Frame& source, const AudioTarget& target,
                                   buffer::Frame& out) {
  if (source.Kind() != buffer::MediaKind::kAudio || source.Validate() != MediaError::kOk) {
    return MediaError::kInvalidBuffer;
  }
  const AVFrame* src = source.RawFramePtr();
  const AVSampleFormat src_fmt = source.SampleFormat();
  const AVSampleFormat dst_fmt =
      target.sample_format == AV_SAMPLE_FMT_NONE ? src_fmt : target.sample_format;
  if (av_get_bytes_per_sample(dst_fmt) <= 0) {
    std::ostringstream oss;
    oss << "[FrameConverter] Unsupported sample format " << static_cast<int>(dst_fmt);
    util::Logger::Warn(oss.str());
    return MediaError::kUnsupportedConversion;
  }

  AVChannelLayout dst_layout{};
  int ret = 0;
  if (target.channels <= 0 || target.channels == src->ch_layout.nb_channels) {
    ret = av_channel_layout_copy(&dst_layout, &src->ch_layout);
  } else {
    av_channel_layout_default(&dst_layout, target.channels);
  }
  if (ret < 0) return MediaError::kOutOfMemory;

  const int samples = source.SampleCount();
  buffer::Frame result;
  MediaError err = buffer::Frame::AllocateAudio(dst_fmt, source.SampleRate(), dst_layout,
                                                samples, result);
  if (err == MediaError::kOk) {
    err = EnsureResampler(src_fmt, src->ch_layout, dst_fmt, dst_layout, source.SampleRate());
  }
  av_channel_layout_uninit(&dst_layout);
  if (err != MediaError::kOk) return err;

  AVFrame* dst = result.RawFramePtr();
  ret = swr_convert(swr_ctx_, dst->extended_data, samples,
                    const_cast<const uint8_t**>(src->extended_data), samples);
  if (ret < 0) {
    util::Logger::Error("[FrameConverter] swr_convert failed: " + util::NativeErrorString(ret));
    return util::MapNativeError(ret, util::NativeContext::kConvert);
  }
  dst->nb_samples = ret;

  err = CopyProps(source, result);
  if (err != MediaError::kOk) return err;
  out = std::move(result);
  return MediaError::kOk;
}

}  // namespace avpipe::convert
