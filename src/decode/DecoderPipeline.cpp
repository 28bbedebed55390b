// Repository: avpipe
// Component: DecoderPipeline
// Purpose: Drives one decoder codec context: feeds packets, drains frames,
//          flushes at end of input.
// Copyright (c) 2025 RetroVue

#include "avpipe/decode/DecoderPipeline.hpp"

#include <cerrno>
#include <sstream>
#include <string>
#include <utility>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
}

#include "avpipe/time/NativeRational.hpp"
#include "avpipe/util/Logger.hpp"

namespace avpipe::decode {

namespace {

using util::Logger;
using util::MediaError;

// send_packet may refuse input until buffered frames are taken; bounded so a
// misbehaving decoder cannot spin forever.
constexpr int kMaxEagainRetries = 4;

// Consecutive receive errors tolerated while draining at end of input.
constexpr int kMaxFlushErrors = 16;

}  // namespace

const char* DecoderStateName(DecoderState state) {
  switch (state) {
    case DecoderState::kIdle: return "Idle";
    case DecoderState::kFeeding: return "Feeding";
    case DecoderState::kDraining: return "Draining";
    case DecoderState::kFlushed: return "Flushed";
  }
  return "Unknown";
}

DecoderPipeline::DecoderPipeline(const DecoderConfig& config) : config_(config) {}

DecoderPipeline::~DecoderPipeline() {
  Close();
}

MediaError DecoderPipeline::Open(const io::StreamDescriptor& descriptor) {
  if (codec_ctx_) Close();
  stats_ = DecoderStats();

  if (!descriptor.IsValid()) {
    Logger::Error("[DecoderPipeline] DECODER_STEP open FAILED (empty stream descriptor)");
    return MediaError::kInitializationFailed;
  }
  if (!descriptor.TimeBase().IsValid()) {
    Logger::Error("[DecoderPipeline] DECODER_STEP open FAILED (invalid time base)");
    return MediaError::kInvalidTimeBase;
  }

  // DECODER_STEP: find_decoder
  const AVCodec* codec = avcodec_find_decoder(descriptor.CodecId());
  if (!codec) {
    Logger::Error("[DecoderPipeline] DECODER_STEP find_decoder FAILED codec=" +
                  descriptor.CodecName());
    return MediaError::kUnsupportedCodec;
  }

  // DECODER_STEP: alloc_context
  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    Logger::Error("[DecoderPipeline] DECODER_STEP alloc_context FAILED");
    return MediaError::kOutOfMemory;
  }

  int ret = avcodec_parameters_to_context(codec_ctx_, descriptor.Parameters());
  if (ret < 0) {
    CloseAfterFatal(util::MapInitError(ret, false), "parameters_to_context", ret);
    return util::MapInitError(ret, false);
  }
  codec_ctx_->pkt_timebase = time::ToAVRational(descriptor.TimeBase());
  codec_ctx_->thread_count = config_.max_decode_threads;
  if (config_.max_decode_threads != 1) {
    codec_ctx_->thread_type = FF_THREAD_FRAME;
  }
  if (config_.strict_errors) {
    codec_ctx_->err_recognition |= AV_EF_EXPLODE;
  }

  // DECODER_STEP: open_codec
  ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    CloseAfterFatal(util::MapInitError(ret, false), "open_codec", ret);
    return util::MapInitError(ret, false);
  }

  scratch_frame_ = av_frame_alloc();
  if (!scratch_frame_) {
    CloseAfterFatal(MediaError::kOutOfMemory, "frame_alloc", AVERROR(ENOMEM));
    return MediaError::kOutOfMemory;
  }

  output_size_ = convert::Dimensions();
  if (descriptor.Kind() == buffer::MediaKind::kVideo) {
    output_size_ = convert::Dimensions{descriptor.Width(), descriptor.Height()};
    if (config_.resize) {
      // DECODER_STEP: compute_resize
      std::optional<convert::Dimensions> resized = config_.resize->ComputeFor(output_size_);
      if (!resized) {
        std::ostringstream oss;
        oss << "[DecoderPipeline] DECODER_STEP compute_resize FAILED "
            << config_.resize->ToString() << " for " << output_size_.width << "x"
            << output_size_.height;
        Logger::Error(oss.str());
        Close();
        return MediaError::kInvalidSettings;
      }
      output_size_ = *resized;
    }
  }

  descriptor_ = descriptor;
  time_base_ = descriptor.TimeBase();
  kind_ = descriptor.Kind();
  state_ = DecoderState::kFeeding;

  std::string resize_note;
  if (config_.resize && kind_ == buffer::MediaKind::kVideo) {
    resize_note = " resize=" + config_.resize->ToString() + " out=" +
                  std::to_string(output_size_.width) + "x" + std::to_string(output_size_.height);
  }
  Logger::Info("[DecoderPipeline] DECODER_STEP open OK " + descriptor.ToString() +
               " decoder=" + codec->name + resize_note);
  return MediaError::kOk;
}

void DecoderPipeline::Close() {
  if (scratch_frame_) {
    av_frame_free(&scratch_frame_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  pending_.clear();
  state_ = DecoderState::kIdle;
}

void DecoderPipeline::CloseAfterFatal(MediaError error, const char* step, int native_code) {
  std::ostringstream oss;
  oss << "[DecoderPipeline] DECODER_STEP " << step << " FAILED error="
      << util::MediaErrorName(error) << " ret=" << native_code
      << " err=" << util::NativeErrorString(native_code) << " (pipeline closed)";
  Logger::Error(oss.str());
  Close();
}

MediaError DecoderPipeline::Submit(const buffer::Packet& packet) {
  if (state_ != DecoderState::kFeeding) {
    Logger::Warn(std::string("[DecoderPipeline] Submit rejected in state ") +
                 DecoderStateName(state_));
    return MediaError::kPipelineClosed;
  }
  // An empty packet would signal end of input to the native decoder.
  if (packet.IsEmpty()) {
    Logger::Warn("[DecoderPipeline] Submit rejected empty packet (use Flush)");
    return MediaError::kInvalidBuffer;
  }
  if (config_.filter_stream_index && packet.StreamIndex() != descriptor_.Index()) {
    stats_.packets_filtered++;
    return MediaError::kOk;
  }

  stats_.packets_submitted++;

  MediaError send_err;
  if (packet.TimeBase().IsValid() && packet.TimeBase() != time_base_) {
    buffer::Packet rescaled;
    MediaError err = packet.Clone(rescaled);
    if (err != MediaError::kOk) {
      CloseAfterFatal(err, "clone_packet", AVERROR(ENOMEM));
      return err;
    }
    rescaled.RescaleTs(time_base_);
    send_err = SendPacket(rescaled.RawPacketPtr());
  } else {
    send_err = SendPacket(packet.RawPacketPtr());
  }
  if (util::IsFatal(send_err)) return send_err;

  // Frames produced by earlier packets are collected even when this one
  // failed.
  MediaError drain_err = Drain(false);
  if (util::IsFatal(drain_err)) return drain_err;
  if (send_err != MediaError::kOk) return send_err;
  return drain_err == MediaError::kEndOfStream ? MediaError::kOk : drain_err;
}

MediaError DecoderPipeline::SendPacket(const AVPacket* packet) {
  int ret = 0;
  for (int attempt = 0; attempt <= kMaxEagainRetries; ++attempt) {
    ret = avcodec_send_packet(codec_ctx_, packet);
    if (ret != AVERROR(EAGAIN)) break;
    MediaError err = Drain(false);
    if (util::IsFatal(err)) return err;
  }
  if (ret >= 0) return MediaError::kOk;

  MediaError err = util::MapDecodeError(ret);
  if (ret == AVERROR(EAGAIN)) err = MediaError::kDecodeError;
  if (err == MediaError::kOutOfMemory) {
    CloseAfterFatal(err, "send_packet", ret);
    return err;
  }
  stats_.decode_errors++;
  std::ostringstream oss;
  oss << "[DecoderPipeline] send_packet rejected packet #" << stats_.packets_submitted
      << " ret=" << ret << " err=" << util::NativeErrorString(ret);
  Logger::Warn(oss.str());
  return err;
}

// Takes every frame the decoder can produce right now. kOk when it wants
// more input, kEndOfStream once fully drained after end of input.
MediaError DecoderPipeline::Drain(bool flushing) {
  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, scratch_frame_);
    if (ret == AVERROR(EAGAIN)) return MediaError::kOk;
    if (ret == AVERROR_EOF) return MediaError::kEndOfStream;
    if (ret < 0) {
      MediaError err = util::MapDecodeError(ret);
      if (err == MediaError::kOutOfMemory) {
        CloseAfterFatal(err, "receive_frame", ret);
        return err;
      }
      stats_.decode_errors++;
      std::ostringstream oss;
      oss << "[DecoderPipeline] receive_frame failed ret=" << ret
          << " err=" << util::NativeErrorString(ret);
      Logger::Warn(oss.str());
      return err;
    }

    AVFrame* owned = av_frame_alloc();
    if (!owned) {
      av_frame_unref(scratch_frame_);
      CloseAfterFatal(MediaError::kOutOfMemory, "frame_alloc", AVERROR(ENOMEM));
      return MediaError::kOutOfMemory;
    }
    av_frame_move_ref(owned, scratch_frame_);
    owned->pts = owned->best_effort_timestamp;

    buffer::Frame frame = buffer::Frame::AttachRawFrame(owned, kind_, time_base_);
    if (config_.resize && kind_ == buffer::MediaKind::kVideo) {
      MediaError err = ApplyResize(frame);
      if (err != MediaError::kOk) return err;
    }
    time::Time pts = frame.Pts();
    pending_.push_back(DecodedFrame{pts, std::move(frame)});
    if (flushing) {
      stats_.frames_during_flush++;
    } else {
      stats_.frames_before_flush++;
    }
  }
}

// Scales a decoded video frame in place. The target is recomputed per frame
// so a mid-stream size change still honours the fit rules.
MediaError DecoderPipeline::ApplyResize(buffer::Frame& frame) {
  std::optional<convert::Dimensions> target =
      config_.resize->ComputeFor(convert::Dimensions{frame.Width(), frame.Height()});
  if (!target) {
    stats_.decode_errors++;
    Logger::Warn("[DecoderPipeline] Resize " + config_.resize->ToString() +
                 " has no size for a " + std::to_string(frame.Width()) + "x" +
                 std::to_string(frame.Height()) + " frame; frame dropped");
    return MediaError::kDecodeError;
  }
  if (target->width == frame.Width() && target->height == frame.Height()) {
    return MediaError::kOk;
  }

  buffer::Frame scaled;
  MediaError err = converter_.Convert(
      frame, convert::VideoTarget{AV_PIX_FMT_NONE, target->width, target->height}, scaled);
  if (err != MediaError::kOk) {
    if (err == MediaError::kOutOfMemory) {
      CloseAfterFatal(err, "resize", AVERROR(ENOMEM));
      return err;
    }
    stats_.decode_errors++;
    Logger::Warn(std::string("[DecoderPipeline] Resize failed (") + util::MediaErrorName(err) +
                 "); frame dropped");
    return MediaError::kDecodeError;
  }
  frame = std::move(scaled);
  stats_.frames_resized++;
  return MediaError::kOk;
}

std::optional<DecodedFrame> DecoderPipeline::NextFrame() {
  if (pending_.empty()) return std::nullopt;
  DecodedFrame next = std::move(pending_.front());
  pending_.pop_front();
  return next;
}

MediaError DecoderPipeline::Flush() {
  if (state_ != DecoderState::kFeeding) {
    Logger::Warn(std::string("[DecoderPipeline] Flush rejected in state ") +
                 DecoderStateName(state_));
    return MediaError::kPipelineClosed;
  }
  state_ = DecoderState::kDraining;

  MediaError result = MediaError::kOk;
  int ret = avcodec_send_packet(codec_ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    result = util::MapDecodeError(ret);
    std::ostringstream oss;
    oss << "[DecoderPipeline] flush send_packet failed ret=" << ret
        << " err=" << util::NativeErrorString(ret);
    Logger::Error(oss.str());
  }

  int errors = 0;
  while (codec_ctx_ && errors < kMaxFlushErrors) {
    MediaError err = Drain(true);
    if (err == MediaError::kEndOfStream) break;
    // After end of input the decoder never asks for more; treat it as done.
    if (err == MediaError::kOk) break;
    if (result == MediaError::kOk) result = err;
    if (util::IsFatal(err)) break;
    ++errors;
  }

  // Terminal even after a failed drain; a fatal error already closed the
  // context, in which case Close() left the pipeline kIdle.
  if (codec_ctx_) state_ = DecoderState::kFlushed;

  std::ostringstream oss;
  oss << "[DecoderPipeline] Flushed frames_before_flush=" << stats_.frames_before_flush
      << " frames_during_flush=" << stats_.frames_during_flush
      << " decode_errors=" << stats_.decode_errors;
  Logger::Info(oss.str());
  return result;
}

MediaError DecoderPipeline::Reset() {
  if (state_ != DecoderState::kFeeding && state_ != DecoderState::kFlushed) {
    Logger::Warn(std::string("[DecoderPipeline] Reset rejected in state ") +
                 DecoderStateName(state_));
    return MediaError::kPipelineClosed;
  }
  // Also clears the end-of-input state left by Flush().
  avcodec_flush_buffers(codec_ctx_);
  pending_.clear();
  state_ = DecoderState::kFeeding;
  stats_.resets++;
  Logger::Debug("[DecoderPipeline] Reset decoder state");
  return MediaError::kOk;
}

int64_t DecoderPipeline::NativeFramesDecoded() const {
  if (!codec_ctx_) return 0;
#if LIBAVCODEC_VERSION_INT >= AV_VERSION_INT(60, 2, 100)
  return codec_ctx_->frame_num;
#else
  return codec_ctx_->frame_number;
#endif
}

}  // namespace avpipe::decode
