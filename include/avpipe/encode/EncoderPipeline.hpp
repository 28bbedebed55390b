// Repository: avpipe
// Component: EncoderPipeline
// Purpose: Drives one encoder codec context: stamps and encodes frames,
//          emits DTS-ordered packets to a container file and/or a sink,
//          flushes and writes the trailer at the end.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_ENCODE_ENCODER_PIPELINE_HPP_
#define AVPIPE_ENCODE_ENCODER_PIPELINE_HPP_

#include <cstdint>
#include <string>

#include "avpipe/buffer/Frame.hpp"
#include "avpipe/buffer/Packet.hpp"
#include "avpipe/encode/EncoderSettings.hpp"
#include "avpipe/io/FormatOptions.hpp"
#include "avpipe/io/PacketStream.hpp"
#include "avpipe/io/StreamDescriptor.hpp"
#include "avpipe/time/Rational.hpp"
#include "avpipe/time/Time.hpp"
#include "avpipe/util/MediaError.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVCodec;
struct AVCodecContext;
struct AVFormatContext;
struct AVFrame;
struct AVPacket;
struct AVStream;

namespace avpipe::encode {

enum class EncoderState {
  kIdle,      // before Open()
  kOpen,      // header written, no frame yet
  kEncoding,
  kFlushing,  // inside Finish()
  kFinished,  // terminal
};

const char* EncoderStateName(EncoderState state);

// Where encoded packets go. Both may be set; with neither, packets are only
// counted.
struct OutputTarget {
  std::string path;                 // Container file; empty = no file
  std::string format;               // Muxer name; overrides EncoderSettings::container_format
  io::IPacketSink* sink = nullptr;  // Receives a reference to every packet (not owned)
  // Muxer options for avformat_write_header (for example
  // io::FragmentedMovOptions()). Entries the muxer does not know are logged.
  io::FormatOptions format_options;
};

struct EncoderStats {
  uint64_t frames_submitted = 0;
  uint64_t packets_emitted = 0;
  uint64_t bytes_emitted = 0;
  uint64_t keyframes_forced = 0;
  uint64_t pts_adjustments = 0;  // input PTS bumped to stay strictly increasing
  uint64_t dts_corrections = 0;  // output DTS bumped to stay strictly increasing
};

// EncoderPipeline exclusively owns one AVCodecContext and, when writing a
// file, the AVFormatContext around it.
//
// Lifecycle:
// 1. Open(target, settings): validate, open codec, open container, write
//    header → kOpen
// 2. Encode(frame, timestamp) repeatedly → kEncoding. Every packet the
//    encoder releases is emitted before Encode() returns; lookahead means a
//    call may emit none
// 3. Finish(): drain, write trailer → kFinished. Idempotent
//
// Packets leave in strictly increasing DTS order, in the output time base
// (the container stream's, or the codec's when there is no container).
//
// Error Handling:
// - Frame/settings mismatch → kInvalidBuffer; the frame is not consumed and
//   the pipeline stays usable
// - Native encode or mux failure → kEncodeError, fatal: the pipeline goes to
//   kFinished and releases its contexts
// - Encode() after Finish() → kPipelineClosed; the output is untouched
// - Finish() failures are reported, the pipeline is still kFinished. Once
//   finished, Finish() keeps returning the first error that ended the
//   pipeline (fatal Encode() failures included), kOk only for a complete
//   output
//
// Thread Safety: none; one pipeline per thread.
class EncoderPipeline {
 public:
  EncoderPipeline() = default;
  ~EncoderPipeline();

  EncoderPipeline(const EncoderPipeline&) = delete;
  EncoderPipeline& operator=(const EncoderPipeline&) = delete;

  util::MediaError Open(const OutputTarget& target, const EncoderSettings& settings);

  // `timestamp` is converted to the codec time base (nearest tick); a
  // timestamp that does not advance past the previous one is bumped by one
  // tick.
  util::MediaError Encode(const buffer::Frame& frame, const time::Time& timestamp);

  util::MediaError Finish();

  EncoderState State() const { return state_; }
  const EncoderSettings& Settings() const { return settings_; }
  const EncoderStats& GetStats() const { return stats_; }

  // The encoded stream, for decoding it back. Valid after Open(), and
  // still valid after Finish().
  const io::StreamDescriptor& OutputDescriptor() const { return output_descriptor_; }

  const time::Rational& CodecTimeBase() const { return codec_time_base_; }
  const time::Rational& OutputTimeBase() const { return output_time_base_; }

  // Audio encoders with a fixed frame size need exactly this many samples
  // per frame, except for one shorter final frame; 0 means any size.
  int RequiredFrameSamples() const { return required_frame_samples_; }

  // Name of the encoder actually opened ("libx264", "mpeg4", ...).
  const std::string& EncoderName() const { return encoder_name_; }

 private:
  util::MediaError AllocateContainer();
  util::MediaError OpenCodec(const AVCodec* codec, bool global_header);
  util::MediaError StartContainer();
  util::MediaError CheckFrame(const buffer::Frame& frame) const;
  util::MediaError SendFrame(const AVFrame* frame);
  util::MediaError Drain();
  util::MediaError EmitPacket();
  void EnforceMonotonicDts(AVPacket* packet);
  void FailFatal(const char* step, int native_code);
  void Release();

  EncoderSettings settings_;
  OutputTarget target_;
  EncoderState state_ = EncoderState::kIdle;

  AVCodecContext* codec_ctx_ = nullptr;
  AVFormatContext* format_ctx_ = nullptr;
  AVStream* stream_ = nullptr;  // owned by format_ctx_
  AVPacket* packet_ = nullptr;
  bool header_written_ = false;

  std::string encoder_name_;
  time::Rational codec_time_base_;
  time::Rational output_time_base_;
  io::StreamDescriptor output_descriptor_;
  int required_frame_samples_ = 0;

  bool short_frame_seen_ = false;
  util::MediaError end_result_ = util::MediaError::kOk;

  int64_t last_input_pts_ = 0;
  bool have_last_input_pts_ = false;
  int64_t last_mux_dts_ = 0;
  bool have_last_mux_dts_ = false;

  EncoderStats stats_;
};

}  // namespace avpipe::encode

#endif  // AVPIPE_ENCODE_ENCODER_PIPELINE_HPP_
