// Repository: avpipe
// Component: EncoderPipeline
// Purpose: Drives one encoder codec context: stamps and encodes frames,
//          emits DTS-ordered packets to a container file and/or a sink,
//          flushes and writes the trailer at the end.
// Copyright (c) 2025 RetroVue

#include "avpipe/encode/EncoderPipeline.hpp"

#include <cerrno>
#include <sstream>
#include <string>
#include <utility>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/opt.h>
}

#include "avpipe/io/FormatOptions.hpp"
#include "avpipe/time/NativeRational.hpp"
#include "avpipe/util/Logger.hpp"

namespace avpipe::encode {

namespace {

using util::Logger;
using util::MediaError;

constexpr int kMaxEagainRetries = 8;

// FFmpeg 7.1 replaced the AVCodec format/rate arrays with
// avcodec_get_supported_config().
#if LIBAVCODEC_VERSION_INT >= AV_VERSION_INT(61, 13, 100)
#define AVPIPE_HAS_SUPPORTED_CONFIG 1
#endif

bool PixelFormatSupported(const AVCodec* codec, AVPixelFormat format) {
#ifdef AVPIPE_HAS_SUPPORTED_CONFIG
  const void* configs = nullptr;
  int count = 0;
  if (avcodec_get_supported_config(nullptr, codec, AV_CODEC_CONFIG_PIX_FORMAT, 0, &configs,
                                   &count) < 0) {
    return false;
  }
  if (!configs) return true;  // unrestricted
  const auto* formats = static_cast<const AVPixelFormat*>(configs);
  for (int i = 0; i < count; ++i) {
    if (formats[i] == format) return true;
  }
  return false;
#else
  if (!codec->pix_fmts) return true;
  for (const AVPixelFormat* p = codec->pix_fmts; *p != AV_PIX_FMT_NONE; ++p) {
    if (*p == format) return true;
  }
  return false;
#endif
}

bool SampleFormatSupported(const AVCodec* codec, AVSampleFormat format) {
#ifdef AVPIPE_HAS_SUPPORTED_CONFIG
  const void* configs = nullptr;
  int count = 0;
  if (avcodec_get_supported_config(nullptr, codec, AV_CODEC_CONFIG_SAMPLE_FORMAT, 0, &configs,
                                   &count) < 0) {
    return false;
  }
  if (!configs) return true;
  const auto* formats = static_cast<const AVSampleFormat*>(configs);
  for (int i = 0; i < count; ++i) {
    if (formats[i] == format) return true;
  }
  return false;
#else
  if (!codec->sample_fmts) return true;
  for (const AVSampleFormat* p = codec->sample_fmts; *p != AV_SAMPLE_FMT_NONE; ++p) {
    if (*p == format) return true;
  }
  return false;
#endif
}

bool SampleRateSupported(const AVCodec* codec, int rate) {
#ifdef AVPIPE_HAS_SUPPORTED_CONFIG
  const void* configs = nullptr;
  int count = 0;
  if (avcodec_get_supported_config(nullptr, codec, AV_CODEC_CONFIG_SAMPLE_RATE, 0, &configs,
                                   &count) < 0) {
    return false;
  }
  if (!configs) return true;
  const auto* rates = static_cast<const int*>(configs);
  for (int i = 0; i < count; ++i) {
    if (rates[i] == rate) return true;
  }
  return false;
#else
  if (!codec->supported_samplerates) return true;
  for (const int* p = codec->supported_samplerates; *p != 0; ++p) {
    if (*p == rate) return true;
  }
  return false;
#endif
}

bool HasPrivateOption(const AVCodec* codec, const char* name) {
  if (!codec->priv_class) return false;
  const AVClass* cls = codec->priv_class;
  return av_opt_find(&cls, name, nullptr, 0, AV_OPT_SEARCH_FAKE_OBJ) != nullptr;
}

// Named encoder first; a missing named encoder (libx264 in an LGPL build)
// falls back to the default encoder for the id.
const AVCodec* FindEncoder(const EncoderSettings& settings) {
  if (!settings.codec_name.empty()) {
    const AVCodec* codec = avcodec_find_encoder_by_name(settings.codec_name.c_str());
    if (codec) return codec;
    if (settings.codec_id != AV_CODEC_ID_NONE) {
      Logger::Warn("[EncoderPipeline] Encoder '" + settings.codec_name +
                   "' not available, falling back to default " +
                   avcodec_get_name(settings.codec_id) + " encoder");
    }
  }
  if (settings.codec_id == AV_CODEC_ID_NONE) return nullptr;
  return avcodec_find_encoder(settings.codec_id);
}

}  // namespace

const char* EncoderStateName(EncoderState state) {
  switch (state) {
    case EncoderState::kIdle: return "Idle";
    case EncoderState::kOpen: return "Open";
    case EncoderState::kEncoding: return "Encoding";
    case EncoderState::kFlushing: return "Flushing";
    case EncoderState::kFinished: return "Finished";
  }
  return "Unknown";
}

EncoderPipeline::~EncoderPipeline() {
  if (state_ == EncoderState::kOpen || state_ == EncoderState::kEncoding) {
    Logger::Warn("[EncoderPipeline] Destroyed without Finish(); output abandoned (frames=" +
                 std::to_string(stats_.frames_submitted) + ")");
  }
  Release();
}

MediaError EncoderPipeline::Open(const OutputTarget& target, const EncoderSettings& settings) {
  if (state_ != EncoderState::kIdle) {
    Logger::Warn(std::string("[EncoderPipeline] Open() ignored in state ") +
                 EncoderStateName(state_));
    return MediaError::kPipelineClosed;
  }

  MediaError err = settings.Validate();
  if (err != MediaError::kOk) {
    Logger::Error("[EncoderPipeline] ENCODER_STEP validate FAILED (" +
                  std::string(util::MediaErrorName(err)) + ") " + settings.ToString());
    return err;
  }

  settings_ = settings;
  target_ = target;
  stats_ = EncoderStats();
  end_result_ = MediaError::kOk;
  short_frame_seen_ = false;
  have_last_input_pts_ = false;
  have_last_mux_dts_ = false;

  // ENCODER_STEP: find_encoder
  const AVCodec* codec = FindEncoder(settings_);
  if (!codec) {
    Logger::Error("[EncoderPipeline] ENCODER_STEP find_encoder FAILED " + settings_.ToString());
    return MediaError::kUnsupportedCodec;
  }
  encoder_name_ = codec->name;

  const AVMediaType expected =
      settings_.kind == buffer::MediaKind::kAudio ? AVMEDIA_TYPE_AUDIO : AVMEDIA_TYPE_VIDEO;
  if (codec->type != expected) {
    Logger::Error("[EncoderPipeline] ENCODER_STEP find_encoder FAILED (" + encoder_name_ +
                  " is not a " + buffer::MediaKindName(settings_.kind) + " encoder)");
    return MediaError::kInvalidSettings;
  }

  // ENCODER_STEP: check_formats
  if (settings_.kind == buffer::MediaKind::kVideo) {
    if (!PixelFormatSupported(codec, settings_.pixel_format)) {
      Logger::Error("[EncoderPipeline] ENCODER_STEP check_formats FAILED (" + encoder_name_ +
                    " rejects pixel format) " + settings_.ToString());
      return MediaError::kInvalidSettings;
    }
  } else {
    if (!SampleFormatSupported(codec, settings_.sample_format) ||
        !SampleRateSupported(codec, settings_.sample_rate)) {
      Logger::Error("[EncoderPipeline] ENCODER_STEP check_formats FAILED (" + encoder_name_ +
                    " rejects sample layout) " + settings_.ToString());
      return MediaError::kInvalidSettings;
    }
  }

  if (!target_.path.empty()) {
    err = AllocateContainer();
    if (err != MediaError::kOk) {
      Release();
      return err;
    }
  }

  // The container must be known before the codec opens: muxers that carry
  // codec headers out of band need the global header flag at open time.
  const bool global_header =
      format_ctx_ && (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) != 0;
  err = OpenCodec(codec, global_header);
  if (err != MediaError::kOk) {
    Release();
    return err;
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    Logger::Error("[EncoderPipeline] ENCODER_STEP alloc_packet FAILED");
    Release();
    return MediaError::kOutOfMemory;
  }

  if (format_ctx_) {
    err = StartContainer();
    if (err != MediaError::kOk) {
      Release();
      return err;
    }
    err = io::StreamDescriptor::FromParameters(stream_->codecpar, output_time_base_,
                                               stream_->index, output_descriptor_,
                                               settings_.kind == buffer::MediaKind::kVideo
                                                   ? settings_.frame_rate
                                                   : time::Rational());
  } else {
    output_time_base_ = codec_time_base_;
    err = io::StreamDescriptor::FromCodecContext(codec_ctx_, 0, output_descriptor_);
  }
  if (err != MediaError::kOk) {
    Logger::Error("[EncoderPipeline] ENCODER_STEP describe_output FAILED");
    Release();
    return err;
  }

  state_ = EncoderState::kOpen;

  std::ostringstream oss;
  oss << "[EncoderPipeline] Opened encoder=" << encoder_name_ << " " << settings_.ToString()
      << " codec_tb=" << codec_time_base_.num << "/" << codec_time_base_.den
      << " out_tb=" << output_time_base_.num << "/" << output_time_base_.den;
  if (!target_.path.empty()) oss << " path=" << target_.path;
  if (target_.sink) oss << " sink=yes";
  Logger::Info(oss.str());
  return MediaError::kOk;
}

MediaError EncoderPipeline::AllocateContainer() {
  const char* format_name = nullptr;
  if (!target_.format.empty()) {
    format_name = target_.format.c_str();
  } else if (!settings_.container_format.empty()) {
    format_name = settings_.container_format.c_str();
  }

  // ENCODER_STEP: alloc_output_context (format guessed from the path when
  // no name is given)
  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, format_name,
                                           target_.path.c_str());
  if (ret < 0 || !format_ctx_) {
    Logger::Error("[EncoderPipeline] ENCODER_STEP alloc_output_context FAILED path=" +
                  target_.path + ": " + util::NativeErrorString(ret));
    return ret < 0 ? util::MapNativeError(ret, util::NativeContext::kContainerOpen)
                   : MediaError::kInitializationFailed;
  }
  return MediaError::kOk;
}

MediaError EncoderPipeline::OpenCodec(const AVCodec* codec, bool global_header) {
  // ENCODER_STEP: alloc_context
  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    Logger::Error("[EncoderPipeline] ENCODER_STEP alloc_context FAILED");
    return MediaError::kOutOfMemory;
  }

  codec_ctx_->time_base = time::ToAVRational(settings_.EffectiveTimeBase());
  if (settings_.kind == buffer::MediaKind::kVideo) {
    codec_ctx_->width = settings_.width;
    codec_ctx_->height = settings_.height;
    codec_ctx_->pix_fmt = settings_.pixel_format;
    codec_ctx_->framerate = time::ToAVRational(settings_.frame_rate);
    codec_ctx_->sample_aspect_ratio = AVRational{1, 1};
    if (settings_.keyframe_interval > 0) codec_ctx_->gop_size = settings_.keyframe_interval;
    codec_ctx_->max_b_frames = settings_.allow_bframes ? settings_.max_b_frames : 0;
  } else {
    codec_ctx_->sample_fmt = settings_.sample_format;
    codec_ctx_->sample_rate = settings_.sample_rate;
    av_channel_layout_default(&codec_ctx_->ch_layout, settings_.channels);
  }
  if (settings_.bitrate > 0) codec_ctx_->bit_rate = settings_.bitrate;
  codec_ctx_->thread_count = settings_.thread_count;
  if (global_header) codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

  io::NativeOptions opts;
  MediaError err = opts.Assign(settings_.codec_options);
  if (err == MediaError::kOk && settings_.crf >= 0) {
    err = opts.Set("crf", std::to_string(settings_.crf));
  }
  if (err == MediaError::kOk && settings_.qp >= 0) {
    if (HasPrivateOption(codec, "qp")) {
      err = opts.Set("qp", std::to_string(settings_.qp));
    } else {
      codec_ctx_->flags |= AV_CODEC_FLAG_QSCALE;
      codec_ctx_->global_quality = FF_QP2LAMBDA * settings_.qp;
    }
  }
  if (err != MediaError::kOk) return err;

  // ENCODER_STEP: avcodec_open2
  int ret = avcodec_open2(codec_ctx_, codec, opts.Address());
  opts.WarnUnused("EncoderPipeline", codec->name);

  if (ret < 0) {
    Logger::Error("[EncoderPipeline] ENCODER_STEP avcodec_open2 FAILED encoder=" +
                  std::string(codec->name) + ": " + util::NativeErrorString(ret));
    return util::MapInitError(ret, true);
  }

  // Some encoders adjust the time base they were given.
  codec_time_base_ = time::FromAVRational(codec_ctx_->time_base);

  required_frame_samples_ = 0;
  if (settings_.kind == buffer::MediaKind::kAudio &&
      (codec->capabilities & AV_CODEC_CAP_VARIABLE_FRAME_SIZE) == 0) {
    required_frame_samples_ = codec_ctx_->frame_size;
  }
  return MediaError::kOk;
}

MediaError EncoderPipeline::StartContainer() {
  // ENCODER_STEP: new_stream
  stream_ = avformat_new_stream(format_ctx_, nullptr);
  if (!stream_) {
    Logger::Error("[EncoderPipeline] ENCODER_STEP new_stream FAILED");
    return MediaError::kOutOfMemory;
  }
  stream_->time_base = codec_ctx_->time_base;
  if (settings_.kind == buffer::MediaKind::kVideo) {
    stream_->avg_frame_rate = codec_ctx_->framerate;
  }

  // Parameters are copied after avcodec_open2 so extradata is included.
  int ret = avcodec_parameters_from_context(stream_->codecpar, codec_ctx_);
  if (ret < 0) {
    Logger::Error("[EncoderPipeline] ENCODER_STEP parameters_from_context FAILED: " +
                  util::NativeErrorString(ret));
    return util::MapInitError(ret, true);
  }

  // ENCODER_STEP: avio_open
  if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
    ret = avio_open(&format_ctx_->pb, target_.path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
      Logger::Error("[EncoderPipeline] ENCODER_STEP avio_open FAILED path=" + target_.path +
                    ": " + util::NativeErrorString(ret));
      return util::MapNativeError(ret, util::NativeContext::kContainerOpen);
    }
  }

  // ENCODER_STEP: write_header (muxer options such as movflags)
  io::NativeOptions muxer_opts;
  MediaError err = muxer_opts.Assign(target_.format_options);
  if (err != MediaError::kOk) return err;
  ret = avformat_write_header(format_ctx_, muxer_opts.Address());
  muxer_opts.WarnUnused("EncoderPipeline", format_ctx_->oformat->name);
  if (ret < 0) {
    Logger::Error("[EncoderPipeline] ENCODER_STEP write_header FAILED format=" +
                  std::string(format_ctx_->oformat->name) + ": " + util::NativeErrorString(ret));
    return util::MapNativeError(ret, util::NativeContext::kContainerOpen);
  }
  header_written_ = true;

  // The muxer may have replaced the stream time base.
  output_time_base_ = time::FromAVRational(stream_->time_base);
  return MediaError::kOk;
}

MediaError EncoderPipeline::CheckFrame(const buffer::Frame& frame) const {
  if (!frame.HasNative() || frame.Kind() != settings_.kind) return MediaError::kInvalidBuffer;
  MediaError err = frame.Validate();
  if (err != MediaError::kOk) return err;

  if (settings_.kind == buffer::MediaKind::kVideo) {
    if (frame.PixelFormat() != settings_.pixel_format || frame.Width() != settings_.width ||
        frame.Height() != settings_.height) {
      return MediaError::kInvalidBuffer;
    }
    return MediaError::kOk;
  }

  if (frame.SampleFormat() != settings_.sample_format ||
      frame.SampleRate() != settings_.sample_rate || frame.Channels() != settings_.channels) {
    return MediaError::kInvalidBuffer;
  }
  if (frame.SampleCount() <= 0) return MediaError::kInvalidBuffer;
  if (required_frame_samples_ > 0) {
    // One shorter frame may end the stream: encoders with
    // AV_CODEC_CAP_SMALL_LAST_FRAME take it as is, FFmpeg pads it with
    // silence for the others. Nothing may follow it.
    if (short_frame_seen_) return MediaError::kInvalidBuffer;
    if (frame.SampleCount() > required_frame_samples_) return MediaError::kInvalidBuffer;
  }
  return MediaError::kOk;
}

MediaError EncoderPipeline::Encode(const buffer::Frame& frame, const time::Time& timestamp) {
  if (state_ != EncoderState::kOpen && state_ != EncoderState::kEncoding) {
    Logger::Warn(std::string("[EncoderPipeline] Encode() rejected in state ") +
                 EncoderStateName(state_));
    return MediaError::kPipelineClosed;
  }

  MediaError err = CheckFrame(frame);
  if (err != MediaError::kOk) {
    std::ostringstream oss;
    oss << "[EncoderPipeline] Frame rejected (" << util::MediaErrorName(err) << ") expected "
        << settings_.ToString();
    if (frame.HasNative() && frame.Kind() == buffer::MediaKind::kVideo) {
      oss << " got " << frame.Width() << "x" << frame.Height();
    } else if (short_frame_seen_) {
      oss << " (a short final frame was already encoded)";
    }
    Logger::Warn(oss.str());
    return err;
  }
  if (!timestamp.HasValue() || !timestamp.TimeBase().IsValid()) {
    Logger::Warn("[EncoderPipeline] Frame rejected (timestamp has no value)");
    return MediaError::kInvalidTimeBase;
  }
  if (required_frame_samples_ > 0 && frame.SampleCount() < required_frame_samples_) {
    short_frame_seen_ = true;
    Logger::Debug("[EncoderPipeline] Short final audio frame (" +
                  std::to_string(frame.SampleCount()) + " of " +
                  std::to_string(required_frame_samples_) + " samples)");
  }

  // The encoder keeps its own reference; the caller's frame is not touched.
  buffer::Frame input;
  err = frame.Clone(input);
  if (err != MediaError::kOk) {
    FailFatal("frame_ref", AVERROR(ENOMEM));
    return err;
  }

  int64_t pts = time::RescaleTicks(*timestamp.Value(), timestamp.TimeBase(), codec_time_base_);
  if (have_last_input_pts_ && pts <= last_input_pts_) {
    if (Logger::DebugEnabled()) {
      std::ostringstream oss;
      oss << "[EncoderPipeline] PTS " << pts << " does not advance past " << last_input_pts_
          << ", bumped to " << (last_input_pts_ + 1);
      Logger::Debug(oss.str());
    }
    pts = last_input_pts_ + 1;
    stats_.pts_adjustments++;
  }
  last_input_pts_ = pts;
  have_last_input_pts_ = true;

  AVFrame* raw = input.RawFramePtr();
  raw->pts = pts;
  raw->time_base = time::ToAVRational(codec_time_base_);
  if (settings_.kind == buffer::MediaKind::kVideo) {
    // One frame period, so muxers can record the last frame's duration.
    raw->duration = time::RescaleTicks(1, settings_.frame_rate.Invert(), codec_time_base_);
  }
  raw->pict_type = AV_PICTURE_TYPE_NONE;
  if (settings_.kind == buffer::MediaKind::kVideo && settings_.keyframe_interval > 0 &&
      stats_.frames_submitted % static_cast<uint64_t>(settings_.keyframe_interval) == 0) {
    raw->pict_type = AV_PICTURE_TYPE_I;
    stats_.keyframes_forced++;
  }

  state_ = EncoderState::kEncoding;
  stats_.frames_submitted++;

  err = SendFrame(raw);
  if (err != MediaError::kOk) return err;

  err = Drain();
  return err == MediaError::kEndOfStream ? MediaError::kOk : err;
}

MediaError EncoderPipeline::SendFrame(const AVFrame* frame) {
  for (int attempt = 0; attempt <= kMaxEagainRetries; ++attempt) {
    int ret = avcodec_send_frame(codec_ctx_, frame);
    if (ret >= 0) return MediaError::kOk;
    if (ret == AVERROR(EAGAIN)) {
      // Output is full; take packets and try again.
      MediaError err = Drain();
      if (err != MediaError::kOk && err != MediaError::kEndOfStream) return err;
      continue;
    }
    if (ret == AVERROR_EOF && !frame) return MediaError::kOk;
    FailFatal(frame ? "send_frame" : "send_flush", ret);
    return ret == AVERROR(ENOMEM) ? MediaError::kOutOfMemory : MediaError::kEncodeError;
  }
  Logger::Error("[EncoderPipeline] ENCODER_STEP send_frame FAILED (encoder refused input " +
                std::to_string(kMaxEagainRetries) + " times)");
  FailFatal("send_frame", AVERROR(EAGAIN));
  return MediaError::kEncodeError;
}

MediaError EncoderPipeline::Drain() {
  while (codec_ctx_) {
    int ret = avcodec_receive_packet(codec_ctx_, packet_);
    if (ret == AVERROR(EAGAIN)) return MediaError::kOk;
    if (ret == AVERROR_EOF) return MediaError::kEndOfStream;
    if (ret < 0) {
      FailFatal("receive_packet", ret);
      return ret == AVERROR(ENOMEM) ? MediaError::kOutOfMemory : MediaError::kEncodeError;
    }
    MediaError err = EmitPacket();
    if (err != MediaError::kOk) return err;
  }
  return MediaError::kPipelineClosed;
}

MediaError EncoderPipeline::EmitPacket() {
  AVPacket* owned = av_packet_alloc();
  if (!owned) {
    av_packet_unref(packet_);
    FailFatal("packet_alloc", AVERROR(ENOMEM));
    return MediaError::kOutOfMemory;
  }
  av_packet_move_ref(owned, packet_);

  buffer::Packet packet = buffer::Packet::AttachRawPacket(owned, codec_time_base_);
  packet.SetStreamIndex(stream_ ? stream_->index : 0);
  packet.RescaleTs(output_time_base_);
  EnforceMonotonicDts(packet.RawPacketPtr());
  packet.RawPacketPtr()->pos = -1;

  stats_.packets_emitted++;
  stats_.bytes_emitted += packet.Size();

  if (target_.sink) {
    buffer::Packet copy;
    MediaError err = packet.Clone(copy);
    if (err != MediaError::kOk) {
      FailFatal("packet_ref", AVERROR(ENOMEM));
      return err;
    }
    err = target_.sink->WritePacket(std::move(copy));
    if (err != MediaError::kOk) {
      Logger::Error(std::string("[EncoderPipeline] Packet sink refused packet (") +
                    util::MediaErrorName(err) + ")");
      FailFatal("sink_write", AVERROR(EIO));
      return MediaError::kEncodeError;
    }
  }

  if (format_ctx_) {
    // ENCODER_STEP: write_frame (the muxer takes the reference)
    int ret = av_interleaved_write_frame(format_ctx_, packet.RawPacketPtr());
    if (ret < 0) {
      FailFatal("write_frame", ret);
      return MediaError::kEncodeError;
    }
  }
  return MediaError::kOk;
}

// Minimal correction: only a DTS that fails to advance is moved, and PTS is
// raised to match when it would fall behind.
void EncoderPipeline::EnforceMonotonicDts(AVPacket* packet) {
  if (packet->dts == AV_NOPTS_VALUE) packet->dts = packet->pts;
  if (packet->dts != AV_NOPTS_VALUE) {
    if (have_last_mux_dts_ && packet->dts <= last_mux_dts_) {
      if (Logger::DebugEnabled()) {
        std::ostringstream oss;
        oss << "[EncoderPipeline] DTS " << packet->dts << " <= last " << last_mux_dts_
            << ", corrected to " << (last_mux_dts_ + 1);
        Logger::Debug(oss.str());
      }
      packet->dts = last_mux_dts_ + 1;
      stats_.dts_corrections++;
    }
    last_mux_dts_ = packet->dts;
    have_last_mux_dts_ = true;
  }
  if (packet->pts != AV_NOPTS_VALUE && packet->dts != AV_NOPTS_VALUE &&
      packet->pts < packet->dts) {
    packet->pts = packet->dts;
  }
}

MediaError EncoderPipeline::Finish() {
  // Repeated calls report how the pipeline ended, including a fatal error
  // that ended it before any Finish().
  if (state_ == EncoderState::kFinished) return end_result_;
  if (state_ == EncoderState::kIdle) return MediaError::kPipelineClosed;

  state_ = EncoderState::kFlushing;
  MediaError result = MediaError::kOk;

  // ENCODER_STEP: flush
  MediaError err = SendFrame(nullptr);
  if (err == MediaError::kOk) {
    err = Drain();
    if (err != MediaError::kOk && err != MediaError::kEndOfStream) result = err;
  } else {
    result = err;
  }

  // A fatal error above already released the contexts.
  if (format_ctx_ && header_written_) {
    // ENCODER_STEP: write_trailer
    int ret = av_write_trailer(format_ctx_);
    if (ret < 0) {
      Logger::Error("[EncoderPipeline] ENCODER_STEP write_trailer FAILED: " +
                    util::NativeErrorString(ret));
      if (result == MediaError::kOk) {
        result = util::MapNativeError(ret, util::NativeContext::kContainerWrite);
      }
    }
    header_written_ = false;
  }
  if (format_ctx_ && format_ctx_->pb && !(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
    int ret = avio_closep(&format_ctx_->pb);
    if (ret < 0) {
      Logger::Error("[EncoderPipeline] ENCODER_STEP avio_close FAILED: " +
                    util::NativeErrorString(ret));
      if (result == MediaError::kOk) {
        result = util::MapNativeError(ret, util::NativeContext::kContainerWrite);
      }
    }
  }

  std::ostringstream oss;
  oss << "[EncoderPipeline] Finished encoder=" << encoder_name_
      << " frames=" << stats_.frames_submitted << " packets=" << stats_.packets_emitted
      << " bytes=" << stats_.bytes_emitted << " dts_corrections=" << stats_.dts_corrections
      << " result=" << util::MediaErrorName(result);
  Logger::Info(oss.str());

  Release();
  state_ = EncoderState::kFinished;
  if (end_result_ == MediaError::kOk) end_result_ = result;
  return end_result_;
}

void EncoderPipeline::FailFatal(const char* step, int native_code) {
  Logger::Error(std::string("[EncoderPipeline] ENCODER_STEP ") + step + " FAILED: " +
                util::NativeErrorString(native_code) + " (pipeline finished, no trailer)");
  if (end_result_ == MediaError::kOk) {
    end_result_ = native_code == AVERROR(ENOMEM) ? MediaError::kOutOfMemory
                                                 : MediaError::kEncodeError;
  }
  Release();
  state_ = EncoderState::kFinished;
}

void EncoderPipeline::Release() {
  if (packet_) av_packet_free(&packet_);
  if (codec_ctx_) avcodec_free_context(&codec_ctx_);
  if (format_ctx_) {
    if (format_ctx_->pb && !(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
      avio_closep(&format_ctx_->pb);
    }
    avformat_free_context(format_ctx_);
    format_ctx_ = nullptr;
  }
  stream_ = nullptr;
  header_written_ = false;
}

}  // namespace avpipe::encode
