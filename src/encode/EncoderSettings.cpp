// Repository: avpipe
// Component: EncoderSettings
// Purpose: Encoder configuration and named presets.
// Copyright (c) 2025 RetroVue

#include "avpipe/encode/EncoderSettings.hpp"

#include <sstream>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/imgutils.h>
#include <libavutil/pixdesc.h>
}

namespace avpipe::encode {

using util::MediaError;

MediaError EncoderSettings::Validate() const {
  if (codec_name.empty() && codec_id == AV_CODEC_ID_NONE) return MediaError::kInvalidSettings;
  if (keyframe_interval < 0 || thread_count < 0 || bitrate < 0) {
    return MediaError::kInvalidSettings;
  }
  if (allow_bframes && max_b_frames <= 0) return MediaError::kInvalidSettings;

  if (kind == buffer::MediaKind::kVideo) {
    if (width <= 0 || height <= 0 || av_image_check_size(width, height, 0, nullptr) < 0) {
      return MediaError::kInvalidSettings;
    }
    if (!av_pix_fmt_desc_get(pixel_format)) return MediaError::kInvalidSettings;
    if (!frame_rate.IsValid()) return MediaError::kInvalidTimeBase;
  } else if (kind == buffer::MediaKind::kAudio) {
    if (sample_rate <= 0 || channels <= 0) return MediaError::kInvalidSettings;
    if (av_get_bytes_per_sample(sample_format) <= 0) return MediaError::kInvalidSettings;
  } else {
    return MediaError::kInvalidSettings;
  }

  const time::Rational tb = EffectiveTimeBase();
  if (!tb.IsValid() || tb.num > INT32_MAX || tb.den > INT32_MAX) {
    return MediaError::kInvalidTimeBase;
  }
  return MediaError::kOk;
}

time::Rational EncoderSettings::EffectiveTimeBase() const {
  if (time_base.IsValid()) return time_base;
  if (kind == buffer::MediaKind::kAudio) return time::Rational(1, sample_rate);
  return frame_rate.Invert();
}

std::string EncoderSettings::ToString() const {
  std::ostringstream oss;
  oss << "codec=" << (codec_name.empty() ? avcodec_get_name(codec_id) : codec_name);
  if (kind == buffer::MediaKind::kVideo) {
    const char* fmt = av_get_pix_fmt_name(pixel_format);
    oss << " " << width << "x" << height << " " << (fmt ? fmt : "none") << " @ "
        << frame_rate.num << "/" << frame_rate.den << " fps";
  } else {
    const char* fmt = av_get_sample_fmt_name(sample_format);
    oss << " " << sample_rate << "Hz/" << channels << "ch " << (fmt ? fmt : "none");
  }
  const time::Rational tb = EffectiveTimeBase();
  oss << " tb=" << tb.num << "/" << tb.den;
  if (bitrate > 0) oss << " bitrate=" << bitrate;
  if (crf >= 0) oss << " crf=" << crf;
  if (qp >= 0) oss << " qp=" << qp;
  oss << " bframes=" << (allow_bframes ? max_b_frames : 0) << " gop=" << keyframe_interval;
  return oss.str();
}

EncoderSettings PresetH264Yuv420p(int width, int height, bool realtime) {
  EncoderSettings s;
  s.codec_name = "libx264";
  s.codec_id = AV_CODEC_ID_H264;
  s.kind = buffer::MediaKind::kVideo;
  s.width = width;
  s.height = height;
  s.pixel_format = AV_PIX_FMT_YUV420P;
  s.frame_rate = time::FPS_30;
  s.bitrate = 1000000;
  s.keyframe_interval = 12;
  s.codec_options["preset"] = "medium";
  if (realtime) {
    s.codec_options["tune"] = "zerolatency";
    s.allow_bframes = false;
  } else {
    s.allow_bframes = true;
  }
  return s;
}

EncoderSettings PresetH264Lossless(int width, int height) {
  EncoderSettings s;
  s.codec_name = "libx264";
  s.codec_id = AV_CODEC_ID_H264;
  s.width = width;
  s.height = height;
  s.pixel_format = AV_PIX_FMT_YUV420P;
  s.frame_rate = time::FPS_25;
  s.qp = 0;
  s.keyframe_interval = 12;
  s.codec_options["preset"] = "ultrafast";
  return s;
}

EncoderSettings PresetFfv1Lossless(int width, int height) {
  EncoderSettings s;
  s.codec_name = "ffv1";
  s.codec_id = AV_CODEC_ID_FFV1;
  s.width = width;
  s.height = height;
  s.pixel_format = AV_PIX_FMT_YUV420P;
  s.frame_rate = time::FPS_25;
  s.keyframe_interval = 1;
  return s;
}

EncoderSettings PresetMpeg4(int width, int height, bool allow_bframes) {
  EncoderSettings s;
  s.codec_name = "mpeg4";
  s.codec_id = AV_CODEC_ID_MPEG4;
  s.width = width;
  s.height = height;
  s.pixel_format = AV_PIX_FMT_YUV420P;
  s.frame_rate = time::FPS_25;
  s.bitrate = 400000;
  s.allow_bframes = allow_bframes;
  s.max_b_frames = 2;
  s.keyframe_interval = 12;
  return s;
}

EncoderSettings PresetRawVideo(int width, int height, AVPixelFormat format) {
  EncoderSettings s;
  s.codec_name = "rawvideo";
  s.codec_id = AV_CODEC_ID_RAWVIDEO;
  s.width = width;
  s.height = height;
  s.pixel_format = format;
  s.frame_rate = time::FPS_25;
  s.keyframe_interval = 0;
  return s;
}

EncoderSettings PresetPcmS16(int sample_rate, int channels) {
  EncoderSettings s;
  s.codec_name = "pcm_s16le";
  s.codec_id = AV_CODEC_ID_PCM_S16LE;
  s.kind = buffer::MediaKind::kAudio;
  s.sample_rate = sample_rate;
  s.channels = channels;
  s.sample_format = AV_SAMPLE_FMT_S16;
  s.keyframe_interval = 0;
  return s;
}

EncoderSettings PresetAac(int sample_rate, int channels) {
  EncoderSettings s;
  s.codec_name = "aac";
  s.codec_id = AV_CODEC_ID_AAC;
  s.kind = buffer::MediaKind::kAudio;
  s.sample_rate = sample_rate;
  s.channels = channels;
  s.sample_format = AV_SAMPLE_FMT_FLTP;
  s.bitrate = 128000;
  s.keyframe_interval = 0;
  return s;
}

}  // namespace avpipe::encode
