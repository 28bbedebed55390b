// Repository: avpipe
// Component: DecodeSequence
// Purpose: Lazy, finite sequence of decoded frames pulled through a
//          DecoderPipeline from a packet source.
// Copyright (c) 2025 RetroVue

#include "avpipe/decode/DecodeSequence.hpp"

#include <sstream>
#include <utility>

#include "avpipe/util/Logger.hpp"

namespace avpipe::decode {

using util::Logger;
using util::MediaError;

DecodeSequence::DecodeSequence(DecoderPipeline& pipeline, io::IPacketSource& source)
    : pipeline_(pipeline), source_(source) {}

MediaError DecodeSequence::Next(DecodedFrame& out) {
  while (true) {
    if (auto frame = pipeline_.NextFrame()) {
      out = std::move(*frame);
      frames_yielded_++;
      return MediaError::kOk;
    }
    if (finished_) return MediaError::kEndOfStream;

    if (source_exhausted_) {
      // Flush already ran and its frames are gone.
      finished_ = true;
      return MediaError::kEndOfStream;
    }

    buffer::Packet packet;
    MediaError err = source_.ReadPacket(packet);
    if (err == MediaError::kEndOfStream) {
      source_exhausted_ = true;
      MediaError flush_err = pipeline_.Flush();
      if (flush_err != MediaError::kOk) {
        Logger::Warn(std::string("[DecodeSequence] Flush reported ") +
                     util::MediaErrorName(flush_err));
        if (util::IsFatal(flush_err) || flush_err == MediaError::kPipelineClosed) {
          finished_ = true;
          return flush_err;
        }
      }
      continue;
    }
    if (err != MediaError::kOk) {
      finished_ = true;
      return err;
    }

    err = pipeline_.Submit(packet);
    if (err == MediaError::kDecodeError) {
      packet_errors_++;
      std::ostringstream oss;
      oss << "[DecodeSequence] Skipping undecodable packet (errors=" << packet_errors_ << ")";
      Logger::Debug(oss.str());
      continue;
    }
    if (err != MediaError::kOk) {
      finished_ = true;
      return err;
    }
  }
}

}  // namespace avpipe::decode
