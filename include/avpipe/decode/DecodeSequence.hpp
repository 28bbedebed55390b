// Repository: avpipe
// Component: DecodeSequence
// Purpose: Lazy, finite sequence of decoded frames pulled through a
//          DecoderPipeline from a packet source.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_DECODE_DECODE_SEQUENCE_HPP_
#define AVPIPE_DECODE_DECODE_SEQUENCE_HPP_

#include <cstdint>

#include "avpipe/decode/DecoderPipeline.hpp"
#include "avpipe/io/PacketStream.hpp"
#include "avpipe/util/MediaError.hpp"

namespace avpipe::decode {

// Each Next() reads and submits packets only until a frame is available.
// When the source runs dry the pipeline is flushed and the held frames are
// yielded; after that Next() keeps returning kEndOfStream. There is no
// rewind: after a seek of the source the caller resets the pipeline and
// builds a new sequence.
//
// Per-packet decode errors are counted and skipped. Errors of the source or
// fatal pipeline errors end the sequence and are returned.
class DecodeSequence {
 public:
  // `pipeline` must be open (kFeeding). Both references must outlive the
  // sequence.
  DecodeSequence(DecoderPipeline& pipeline, io::IPacketSource& source);

  util::MediaError Next(DecodedFrame& out);

  int64_t FramesYielded() const { return frames_yielded_; }
  int64_t PacketErrors() const { return packet_errors_; }
  bool Finished() const { return finished_; }

 private:
  DecoderPipeline& pipeline_;
  io::IPacketSource& source_;
  bool source_exhausted_ = false;
  bool finished_ = false;
  int64_t frames_yielded_ = 0;
  int64_t packet_errors_ = 0;
};

}  // namespace avpipe::decode

#endif  // AVPIPE_DECODE_DECODE_SEQUENCE_HPP_
