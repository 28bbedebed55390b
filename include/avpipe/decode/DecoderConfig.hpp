// Repository: avpipe
// Component: DecoderConfig
// Purpose: Decoder pipeline configuration and counters.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_DECODE_DECODER_CONFIG_HPP_
#define AVPIPE_DECODE_DECODER_CONFIG_HPP_

#include <cstdint>
#include <optional>

#include "avpipe/convert/Resize.hpp"

namespace avpipe::decode {

// DecoderConfig holds configuration for a DecoderPipeline.
struct DecoderConfig {
  // Decoder threads (0 = auto). Frame threading delays error reports by the
  // thread count, so 1 gives per-packet error attribution.
  int max_decode_threads = 1;

  // Packets whose stream index differs from the opened stream are skipped
  // (counted in packets_filtered) instead of being fed to the decoder.
  bool filter_stream_index = true;

  // Treat any bitstream damage as an error of the packet that carried it
  // (AV_EF_EXPLODE) instead of letting the decoder conceal it.
  bool strict_errors = true;

  // Video frames are scaled to this size (pixel format kept) before they
  // are queued. Ignored for audio.
  std::optional<convert::Resize> resize;
};

// DecoderStats tracks what went in and what came out.
struct DecoderStats {
  uint64_t packets_submitted = 0;
  uint64_t packets_filtered = 0;
  uint64_t frames_before_flush = 0;
  uint64_t frames_during_flush = 0;
  uint64_t decode_errors = 0;
  uint64_t frames_resized = 0;
  uint64_t resets = 0;

  uint64_t FramesDecoded() const { return frames_before_flush + frames_during_flush; }
};

}  // namespace avpipe::decode

#endif  // AVPIPE_DECODE_DECODER_CONFIG_HPP_
