// Repository: avpipe
// Component: MediaDecoder
// Purpose: Reader and decoder pipeline bundled for file decoding, with
//          seeking and stream queries.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_DECODE_MEDIA_DECODER_HPP_
#define AVPIPE_DECODE_MEDIA_DECODER_HPP_

#include <cstdint>
#include <memory>

#include "avpipe/decode/DecodeSequence.hpp"
#include "avpipe/decode/DecoderConfig.hpp"
#include "avpipe/decode/DecoderPipeline.hpp"
#include "avpipe/io/MediaReader.hpp"
#include "avpipe/time/Rational.hpp"
#include "avpipe/time/Time.hpp"
#include "avpipe/util/MediaError.hpp"

namespace avpipe::decode {

struct MediaDecoderConfig {
  io::MediaReaderConfig reader;
  DecoderConfig decoder;
};

// MediaDecoder owns a MediaReader, a DecoderPipeline opened on the reader's
// stream, and the DecodeSequence joining them.
//
// Seek(), SeekToFrame() and SeekToStart() move the reader to the keyframe at
// or before the target, reset the pipeline and start a new DecodeSequence
// from there (a sequence itself never rewinds); frames before the target
// are still yielded, so a caller after an exact position skips them by PTS.
// A failed seek leaves both the read position and the decoder untouched.
//
// Thread Safety: none.
class MediaDecoder {
 public:
  explicit MediaDecoder(const MediaDecoderConfig& config);
  ~MediaDecoder() = default;

  MediaDecoder(const MediaDecoder&) = delete;
  MediaDecoder& operator=(const MediaDecoder&) = delete;

  // Errors of MediaReader::Open and DecoderPipeline::Open.
  util::MediaError Open();
  void Close();
  bool IsOpen() const { return pipeline_.IsOpen(); }

  // Next frame in presentation order; kEndOfStream once the stream ends.
  util::MediaError Next(DecodedFrame& out);

  util::MediaError Seek(const time::Time& position);
  util::MediaError SeekToFrame(int64_t frame_index);
  util::MediaError SeekToStart();

  time::Time Duration() const { return reader_.Duration(); }
  int64_t FrameCount() const { return reader_.FrameCount(); }
  time::Rational FrameRate() const { return reader_.FrameRate(); }

  // Source size and the size of yielded frames (differs under a resize).
  int SourceWidth() const { return reader_.Descriptor().Width(); }
  int SourceHeight() const { return reader_.Descriptor().Height(); }
  int OutputWidth() const { return pipeline_.OutputWidth(); }
  int OutputHeight() const { return pipeline_.OutputHeight(); }

  const io::StreamDescriptor& Descriptor() const { return reader_.Descriptor(); }
  const DecoderStats& GetStats() const { return pipeline_.GetStats(); }
  // Across every sequence since Open().
  int64_t FramesYielded() const { return frames_yielded_; }

 private:
  util::MediaError AfterSeek(util::MediaError seek_result);

  MediaDecoderConfig config_;
  io::MediaReader reader_;
  DecoderPipeline pipeline_;
  std::unique_ptr<DecodeSequence> sequence_;  // rebuilt by Open() and every seek
  int64_t frames_yielded_ = 0;
};

}  // namespace avpipe::decode

#endif  // AVPIPE_DECODE_MEDIA_DECODER_HPP_
