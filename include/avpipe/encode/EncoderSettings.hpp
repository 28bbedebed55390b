// Repository: avpipe
// Component: EncoderSettings
// Purpose: Encoder configuration and named presets.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_ENCODE_ENCODER_SETTINGS_HPP_
#define AVPIPE_ENCODE_ENCODER_SETTINGS_HPP_

#include <cstdint>
#include <map>
#include <string>

extern "C" {
#include <libavcodec/codec_id.h>
#include <libavutil/pixfmt.h>
#include <libavutil/samplefmt.h>
}

#include "avpipe/buffer/Frame.hpp"
#include "avpipe/time/Rational.hpp"
#include "avpipe/util/MediaError.hpp"

namespace avpipe::encode {

// Configuration for EncoderPipeline.
// POD struct - copied into the pipeline at Open() and never changed after.
struct EncoderSettings {
  std::string codec_name;                   // Encoder name ("libx264", "ffv1"); tried first
  AVCodecID codec_id = AV_CODEC_ID_NONE;    // Default encoder for this id when the name is absent
  buffer::MediaKind kind = buffer::MediaKind::kVideo;

  // Video
  int width = 0;
  int height = 0;
  AVPixelFormat pixel_format = AV_PIX_FMT_NONE;
  time::Rational frame_rate{30, 1};

  // Audio
  int sample_rate = 0;
  int channels = 0;
  AVSampleFormat sample_format = AV_SAMPLE_FMT_NONE;

  // Codec time base. Left invalid, it becomes 1/frame_rate (video) or
  // 1/sample_rate (audio).
  time::Rational time_base;

  int64_t bitrate = 0;        // bits per second, 0 = codec default
  int crf = -1;               // constant rate factor (codecs with a "crf" option), -1 = unset
  int qp = -1;                // constant quantizer, -1 = unset
  bool allow_bframes = false;
  int max_b_frames = 2;       // used only when allow_bframes
  int keyframe_interval = 12; // forced I frame every N frames, 0 = encoder decides
  int thread_count = 1;       // 0 = auto

  std::map<std::string, std::string> codec_options;  // codec private options
  std::string container_format;                      // muxer hint ("matroska", "wav", ...)

  // Structural checks that need no codec: positive dimensions or sample
  // layout, known formats, valid rates. kInvalidSettings or kInvalidTimeBase.
  util::MediaError Validate() const;

  time::Rational EffectiveTimeBase() const;

  std::string ToString() const;
};

// Widely compatible H.264, 8-bit 4:2:0 planar, 30 fps, 1 Mbit/s, keyframe
// every 12 frames. `realtime` tunes for zero latency and disables B-frames.
// Uses libx264 when built in, otherwise the default H.264 encoder.
EncoderSettings PresetH264Yuv420p(int width, int height, bool realtime = false);

// Lossless H.264 (libx264, qp 0).
EncoderSettings PresetH264Lossless(int width, int height);

// Lossless FFV1, 4:2:0 planar. Bit-exact round trips.
EncoderSettings PresetFfv1Lossless(int width, int height);

// MPEG-4 Part 2, 25 fps, optional B-frames.
EncoderSettings PresetMpeg4(int width, int height, bool allow_bframes);

// Uncompressed video in the given pixel format.
EncoderSettings PresetRawVideo(int width, int height, AVPixelFormat format);

// Signed 16-bit little-endian PCM, interleaved.
EncoderSettings PresetPcmS16(int sample_rate, int channels);

// AAC-LC, planar float input, 128 kbit/s.
EncoderSettings PresetAac(int sample_rate, int channels);

}  // namespace avpipe::encode

#endif  // AVPIPE_ENCODE_ENCODER_SETTINGS_HPP_
