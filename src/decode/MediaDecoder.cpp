// Repository: avpipe
// Component: MediaDecoder
// Purpose: Reader and decoder pipeline bundled for file decoding, with
//          seeking and stream queries.
// Copyright (c) 2025 RetroVue

#include "avpipe/decode/MediaDecoder.hpp"

#include <memory>
#include <string>

#include "avpipe/util/Logger.hpp"

namespace avpipe::decode {

using util::Logger;
using util::MediaError;

MediaDecoder::MediaDecoder(const MediaDecoderConfig& config)
    : config_(config),
      reader_(config.reader),
      pipeline_(config.decoder) {}

MediaError MediaDecoder::Open() {
  MediaError err = reader_.Open();
  if (err != MediaError::kOk) return err;

  err = pipeline_.Open(reader_.Descriptor());
  if (err != MediaError::kOk) {
    Logger::Error(std::string("[MediaDecoder] Decoder open failed (") +
                  util::MediaErrorName(err) + ") uri=" + config_.reader.input_uri);
    reader_.Close();
    return err;
  }
  sequence_ = std::make_unique<DecodeSequence>(pipeline_, reader_);
  frames_yielded_ = 0;
  return MediaError::kOk;
}

void MediaDecoder::Close() {
  sequence_.reset();
  pipeline_.Close();
  reader_.Close();
}

MediaError MediaDecoder::Next(DecodedFrame& out) {
  if (!sequence_ || !pipeline_.IsOpen()) return MediaError::kPipelineClosed;
  MediaError err = sequence_->Next(out);
  if (err == MediaError::kOk) frames_yielded_++;
  return err;
}

MediaError MediaDecoder::Seek(const time::Time& position) {
  if (!sequence_ || !pipeline_.IsOpen()) return MediaError::kPipelineClosed;
  return AfterSeek(reader_.Seek(position));
}

MediaError MediaDecoder::SeekToFrame(int64_t frame_index) {
  if (!sequence_ || !pipeline_.IsOpen()) return MediaError::kPipelineClosed;
  return AfterSeek(reader_.SeekToFrame(frame_index));
}

MediaError MediaDecoder::SeekToStart() {
  if (!sequence_ || !pipeline_.IsOpen()) return MediaError::kPipelineClosed;
  return AfterSeek(reader_.SeekToStart());
}

MediaError MediaDecoder::AfterSeek(MediaError seek_result) {
  if (seek_result != MediaError::kOk) return seek_result;
  MediaError err = pipeline_.Reset();
  if (err != MediaError::kOk) {
    Logger::Error(std::string("[MediaDecoder] Decoder reset after seek failed (") +
                  util::MediaErrorName(err) + ")");
    return err;
  }
  sequence_ = std::make_unique<DecodeSequence>(pipeline_, reader_);
  return MediaError::kOk;
}

}  // namespace avpipe::decode
