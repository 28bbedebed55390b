// Repository: avpipe
// Component: DecoderPipeline
// Purpose: Drives one decoder codec context: feeds packets, drains frames,
//          flushes at end of input.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_DECODE_DECODER_PIPELINE_HPP_
#define AVPIPE_DECODE_DECODER_PIPELINE_HPP_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

#include "avpipe/buffer/Frame.hpp"
#include "avpipe/buffer/Packet.hpp"
#include "avpipe/convert/FrameConverter.hpp"
#include "avpipe/convert/Resize.hpp"
#include "avpipe/decode/DecoderConfig.hpp"
#include "avpipe/io/StreamDescriptor.hpp"
#include "avpipe/time/Time.hpp"
#include "avpipe/util/MediaError.hpp"

struct AVCodecContext;
struct AVFrame;

namespace avpipe::decode {

enum class DecoderState {
  kIdle,      // not opened, or closed after a fatal error
  kFeeding,   // accepting packets
  kDraining,  // end of input signalled, collecting held frames
  kFlushed,   // terminal until reopened
};

const char* DecoderStateName(DecoderState state);

// One element of the decoded sequence: the frame and its presentation time
// in the decoder time base.
struct DecodedFrame {
  time::Time pts;
  buffer::Frame frame;
};

// DecoderPipeline exclusively owns one AVCodecContext.
//
// Lifecycle:
// 1. Open(descriptor) → kFeeding
// 2. Submit(packet) repeatedly; after each call every frame the decoder
//    could produce is queued, to be taken with NextFrame()
// 3. Flush() once at end of input → kDraining → kFlushed
// 4. Close() or destructor releases the context and any queued frames
//
// Reset() after a seek of the packet source discards held frames and
// returns a feeding or flushed pipeline to kFeeding.
//
// Frames come out in the order the decoder emits them (presentation order);
// the pipeline never reorders.
//
// Error Handling:
// - kDecodeError from Submit() covers that packet only; the next packet is
//   accepted normally
// - kOutOfMemory and native context failures close the pipeline (kIdle);
//   callers reopen rather than retry
// - Submit() after Flush(), or before Open(), → kPipelineClosed
//
// Thread Safety: none; one pipeline per thread.
class DecoderPipeline {
 public:
  explicit DecoderPipeline(const DecoderConfig& config = DecoderConfig());
  ~DecoderPipeline();

  DecoderPipeline(const DecoderPipeline&) = delete;
  DecoderPipeline& operator=(const DecoderPipeline&) = delete;

  // kUnsupportedCodec when no decoder exists for the stream's codec,
  // kInitializationFailed when the context cannot be set up,
  // kInvalidSettings when the configured resize has no valid output size
  // for the stream.
  util::MediaError Open(const io::StreamDescriptor& descriptor);

  // Packets in another time base are rescaled to the decoder time base.
  util::MediaError Submit(const buffer::Packet& packet);

  std::optional<DecodedFrame> NextFrame();
  bool HasPendingFrame() const { return !pending_.empty(); }
  size_t PendingFrameCount() const { return pending_.size(); }

  // Signals end of input and collects every frame the decoder still holds.
  // The pipeline ends up kFlushed even when draining fails.
  util::MediaError Flush();

  // Discards decoder state and queued frames (seek-style restart). Valid
  // while feeding or once flushed; the pipeline is kFeeding afterwards.
  util::MediaError Reset();

  void Close();

  DecoderState State() const { return state_; }
  bool IsOpen() const { return codec_ctx_ != nullptr; }
  const DecoderStats& GetStats() const { return stats_; }
  const io::StreamDescriptor& Descriptor() const { return descriptor_; }
  const time::Rational& TimeBase() const { return time_base_; }

  // Size of the video frames this pipeline yields: the resize result, or
  // the stream's own size. 0x0 for audio.
  int OutputWidth() const { return output_size_.width; }
  int OutputHeight() const { return output_size_.height; }

  // Frames the native decoder reports having returned.
  int64_t NativeFramesDecoded() const;

 private:
  util::MediaError SendPacket(const AVPacket* packet);
  util::MediaError Drain(bool flushing);
  util::MediaError ApplyResize(buffer::Frame& frame);
  void CloseAfterFatal(util::MediaError error, const char* step, int native_code);

  DecoderConfig config_;
  DecoderState state_ = DecoderState::kIdle;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* scratch_frame_ = nullptr;
  io::StreamDescriptor descriptor_;
  time::Rational time_base_;
  buffer::MediaKind kind_ = buffer::MediaKind::kUnknown;
  convert::Dimensions output_size_;
  convert::FrameConverter converter_;
  std::deque<DecodedFrame> pending_;
  DecoderStats stats_;
};

}  // namespace avpipe::decode

#endif  // AVPIPE_DECODE_DECODER_PIPELINE_HPP_
