// Repository: avpipe
// Component: MediaReader
// Purpose: Demuxes one elementary stream out of a container file and hands
//          its packets across the stream boundary.
// Copyright (c) 2025 RetroVue

#include "avpipe/io/MediaReader.hpp"

#include <sstream>
#include <string>
#include <utility>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

#include "avpipe/time/NativeRational.hpp"
#include "avpipe/util/Logger.hpp"

namespace avpipe::io {

using util::Logger;
using util::MediaError;

MediaReader::MediaReader(const MediaReaderConfig& config) : config_(config) {}

MediaReader::~MediaReader() {
  Close();
}

MediaError MediaReader::Open() {
  if (format_ctx_) return MediaError::kOk;
  Logger::Info("[MediaReader] Opening: " + config_.input_uri);

  NativeOptions options;
  MediaError opt_err = options.Assign(config_.options);
  if (opt_err != MediaError::kOk) return opt_err;

  // READER_STEP: open_input
  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), nullptr,
                                options.Address());
  options.WarnUnused("MediaReader", "demuxer " + config_.input_uri);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[MediaReader] READER_STEP open_input FAILED uri=" << config_.input_uri
        << " ret=" << ret << " err=" << util::NativeErrorString(ret);
    Logger::Error(oss.str());
    format_ctx_ = nullptr;
    return util::MapNativeError(ret, util::NativeContext::kContainerOpen);
  }

  // READER_STEP: find_stream_info
  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[MediaReader] READER_STEP find_stream_info FAILED uri=" << config_.input_uri
        << " ret=" << ret << " err=" << util::NativeErrorString(ret);
    Logger::Error(oss.str());
    Close();
    return util::MapNativeError(ret, util::NativeContext::kContainerOpen);
  }

  // READER_STEP: select_stream
  const AVMediaType type =
      config_.kind == buffer::MediaKind::kAudio ? AVMEDIA_TYPE_AUDIO : AVMEDIA_TYPE_VIDEO;
  int index = config_.stream_index;
  if (index < 0) {
    index = av_find_best_stream(format_ctx_, type, -1, -1, nullptr, 0);
  } else if (index >= static_cast<int>(format_ctx_->nb_streams) ||
             format_ctx_->streams[index]->codecpar->codec_type != type) {
    index = AVERROR_STREAM_NOT_FOUND;
  }
  if (index < 0) {
    std::ostringstream oss;
    oss << "[MediaReader] READER_STEP select_stream FAILED uri=" << config_.input_uri
        << " (no " << buffer::MediaKindName(config_.kind) << " stream)";
    Logger::Error(oss.str());
    Close();
    return MediaError::kUnsupportedCodec;
  }

  const AVStream* stream = format_ctx_->streams[index];
  MediaError err = StreamDescriptor::FromParameters(
      stream->codecpar, time::FromAVRational(stream->time_base), index, descriptor_,
      time::FromAVRational(stream->avg_frame_rate));
  if (err != MediaError::kOk) {
    Logger::Error(std::string("[MediaReader] READER_STEP describe_stream FAILED err=") +
                  util::MediaErrorName(err));
    Close();
    return err;
  }

  Logger::Info("[MediaReader] READER_STEP open_input OK uri=" + config_.input_uri + " " +
               descriptor_.ToString());
  return MediaError::kOk;
}

void MediaReader::Close() {
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }
  eof_reached_ = false;
}

MediaError MediaReader::ReadPacket(buffer::Packet& out) {
  if (!format_ctx_) return MediaError::kPipelineClosed;
  if (eof_reached_) return MediaError::kEndOfStream;

  while (true) {
    buffer::Packet pkt;
    MediaError err = buffer::Packet::Allocate(descriptor_.TimeBase(), pkt);
    if (err != MediaError::kOk) return err;

    int ret = av_read_frame(format_ctx_, pkt.RawPacketPtr());
    if (ret == AVERROR_EOF) {
      eof_reached_ = true;
      return MediaError::kEndOfStream;
    }
    if (ret < 0) {
      std::ostringstream oss;
      oss << "[MediaReader] av_read_frame failed: " << util::NativeErrorString(ret);
      Logger::Error(oss.str());
      return util::MapNativeError(ret, util::NativeContext::kDecode);
    }

    if (pkt.StreamIndex() != descriptor_.Index()) {
      stats_.packets_skipped++;
      continue;
    }

    stats_.packets_read++;
    stats_.bytes_read += static_cast<int64_t>(pkt.Size());
    out = std::move(pkt);
    return MediaError::kOk;
  }
}

MediaError MediaReader::Seek(const time::Time& position) {
  if (!format_ctx_) return MediaError::kPipelineClosed;
  if (!position.HasValue() || !position.TimeBase().IsValid()) {
    Logger::Warn("[MediaReader] Seek rejected (position has no value)");
    return MediaError::kInvalidTimeBase;
  }
  const int64_t stream_ts = position.Rescale(descriptor_.TimeBase()).ValueOr(0);
  return SeekToTimestamp(stream_ts, "seek");
}

MediaError MediaReader::SeekToFrame(int64_t frame_index) {
  if (!format_ctx_) return MediaError::kPipelineClosed;
  const time::Rational rate = FrameRate();
  if (!rate.IsValid()) {
    Logger::Warn("[MediaReader] SeekToFrame rejected (no frame rate) uri=" +
                 config_.input_uri);
    return MediaError::kInvalidTimeBase;
  }
  return Seek(time::Time::FromFrameCount(frame_index, rate));
}

MediaError MediaReader::SeekToStart() {
  if (!format_ctx_) return MediaError::kPipelineClosed;
  const AVStream* stream = format_ctx_->streams[descriptor_.Index()];
  const int64_t start = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
  return SeekToTimestamp(start, "seek_to_start");
}

MediaError MediaReader::SeekToTimestamp(int64_t stream_ts, const char* what) {
  // READER_STEP: seek (keyframe at or before the target)
  int ret = av_seek_frame(format_ctx_, descriptor_.Index(), stream_ts, AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    // Nothing at or before the target: take the first keyframe after it.
    ret = av_seek_frame(format_ctx_, descriptor_.Index(), stream_ts, 0);
  }
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[MediaReader] READER_STEP " << what << " FAILED ts=" << stream_ts
        << " ret=" << ret << " err=" << util::NativeErrorString(ret);
    Logger::Error(oss.str());
    return util::MapNativeError(ret, util::NativeContext::kContainerSeek);
  }
  eof_reached_ = false;
  stats_.seeks++;
  if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[MediaReader] READER_STEP " << what << " OK ts=" << stream_ts;
    Logger::Debug(oss.str());
  }
  return MediaError::kOk;
}

time::Time MediaReader::Duration() const {
  const time::Rational tb = descriptor_.TimeBase();
  if (!format_ctx_) return time::Time(std::nullopt, tb);
  const AVStream* stream = format_ctx_->streams[descriptor_.Index()];
  if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
    return time::Time(stream->duration, tb);
  }
  if (format_ctx_->duration != AV_NOPTS_VALUE && format_ctx_->duration > 0) {
    return time::Time(format_ctx_->duration, time::Rational(1, AV_TIME_BASE)).Rescale(tb);
  }
  return time::Time(std::nullopt, tb);
}

int64_t MediaReader::FrameCount() const {
  if (!format_ctx_) return 0;
  const AVStream* stream = format_ctx_->streams[descriptor_.Index()];
  if (stream->nb_frames > 0) return stream->nb_frames;

  const time::Time duration = Duration();
  const time::Rational rate = FrameRate();
  if (!duration.HasValue() || !rate.IsValid()) return 0;
  // Frames = duration * rate, rounded to the nearest frame.
  return time::RescaleTicks(*duration.Value(), duration.TimeBase(), rate.Invert());
}

time::Rational MediaReader::FrameRate() const {
  if (!format_ctx_) return time::Rational();
  const AVStream* stream = format_ctx_->streams[descriptor_.Index()];
  if (stream->r_frame_rate.num > 0 && stream->r_frame_rate.den > 0) {
    return time::FromAVRational(stream->r_frame_rate);
  }
  if (stream->avg_frame_rate.num > 0 && stream->avg_frame_rate.den > 0) {
    return time::FromAVRational(stream->avg_frame_rate);
  }
  return time::Rational();
}

}  // namespace avpipe::io
