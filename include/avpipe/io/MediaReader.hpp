// Repository: avpipe
// Component: MediaReader
// Purpose: Demuxes one elementary stream out of a container file and hands
//          its packets across the stream boundary.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_IO_MEDIA_READER_HPP_
#define AVPIPE_IO_MEDIA_READER_HPP_

#include <cstdint>
#include <string>

#include "avpipe/buffer/Frame.hpp"
#include "avpipe/buffer/Packet.hpp"
#include "avpipe/io/FormatOptions.hpp"
#include "avpipe/io/PacketStream.hpp"
#include "avpipe/io/StreamDescriptor.hpp"
#include "avpipe/time/Rational.hpp"
#include "avpipe/time/Time.hpp"
#include "avpipe/util/MediaError.hpp"

struct AVFormatContext;

namespace avpipe::io {

struct MediaReaderConfig {
  std::string input_uri;
  buffer::MediaKind kind = buffer::MediaKind::kVideo;
  // Explicit stream index; -1 picks the best stream of `kind`.
  int stream_index = -1;
  // Demuxer and protocol options for avformat_open_input (for example
  // RtspTransportTcpOptions()). Entries nobody consumed are logged.
  FormatOptions options;
};

struct MediaReaderStats {
  int64_t packets_read = 0;
  int64_t packets_skipped = 0;  // other streams
  int64_t bytes_read = 0;
  int64_t seeks = 0;
};

// MediaReader owns an AVFormatContext and reads the packets of a single
// stream in container order. Packets carry the stream's time base.
//
// Seeking lands on the keyframe at or before the target (AVSEEK_FLAG_BACKWARD)
// so decoding can resume from it; packets between that keyframe and the
// target are still delivered. A decoder fed by this reader must be reset
// after a successful seek. A failed seek returns kDecodeError and leaves the
// read position unchanged.
class MediaReader : public IPacketSource {
 public:
  explicit MediaReader(const MediaReaderConfig& config);
  ~MediaReader() override;

  MediaReader(const MediaReader&) = delete;
  MediaReader& operator=(const MediaReader&) = delete;

  // Opens the container and selects the stream. kInitializationFailed when
  // the file cannot be opened or its stream info cannot be read,
  // kUnsupportedCodec when it has no stream of the requested kind.
  util::MediaError Open();
  void Close();
  bool IsOpen() const { return format_ctx_ != nullptr; }

  const StreamDescriptor& Descriptor() const override { return descriptor_; }
  util::MediaError ReadPacket(buffer::Packet& out) override;

  // `position` in any time base, measured on the stream's own timeline.
  util::MediaError Seek(const time::Time& position);

  // Seeks to the start instant of frame `frame_index` at FrameRate().
  // kInvalidTimeBase when the stream has no usable frame rate.
  util::MediaError SeekToFrame(int64_t frame_index);

  // Back to the first packet of the stream.
  util::MediaError SeekToStart();

  // Stream duration in the stream time base; the container duration when
  // the stream has none; valueless when neither is known.
  time::Time Duration() const;

  // Frame count from the container index, else estimated from Duration()
  // and FrameRate(); 0 when unknown.
  int64_t FrameCount() const;

  // Nominal rate (r_frame_rate), else the average rate; invalid when
  // neither is known.
  time::Rational FrameRate() const;

  const MediaReaderStats& GetStats() const { return stats_; }

 private:
  util::MediaError SeekToTimestamp(int64_t stream_ts, const char* what);

  MediaReaderConfig config_;
  AVFormatContext* format_ctx_ = nullptr;
  StreamDescriptor descriptor_;
  bool eof_reached_ = false;
  MediaReaderStats stats_;
};

}  // namespace avpipe::io

#endif  // AVPIPE_IO_MEDIA_READER_HPP_
