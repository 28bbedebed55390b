// Repository: avpipe
// Component: FormatOptions
// Purpose: Named option sets for demuxers, muxers and codecs, and their
//          hand-off to FFmpeg as an AVDictionary.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_IO_FORMAT_OPTIONS_HPP_
#define AVPIPE_IO_FORMAT_OPTIONS_HPP_

#include <cstddef>
#include <map>
#include <string>

#include "avpipe/util/MediaError.hpp"

struct AVDictionary;

namespace avpipe::io {

// Key/value options in FFmpeg's own spelling (movflags, rtsp_transport, ...).
using FormatOptions = std::map<std::string, std::string>;

// MP4/MOV written as fragments behind an empty moov, so the file can be
// read while it is still being written.
FormatOptions FragmentedMovOptions();

// RTSP over TCP instead of UDP.
FormatOptions RtspTransportTcpOptions();

// RTSP over TCP with 16 s read/write and socket timeouts.
FormatOptions RtspTransportTcpWithTimeoutsOptions();

// `base` with every entry of `overrides` added; overrides win on key clashes.
FormatOptions MergeOptions(FormatOptions base, const FormatOptions& overrides);

// NativeOptions owns the AVDictionary handed to an FFmpeg open call. FFmpeg
// removes the entries it consumes; whatever is left was not recognized.
class NativeOptions {
 public:
  NativeOptions() = default;
  ~NativeOptions();

  NativeOptions(const NativeOptions&) = delete;
  NativeOptions& operator=(const NativeOptions&) = delete;

  // Replaces the contents. kOutOfMemory when an entry cannot be stored.
  util::MediaError Assign(const FormatOptions& options);
  util::MediaError Set(const std::string& key, const std::string& value);

  // For avformat_open_input / avformat_write_header / avcodec_open2.
  AVDictionary** Address() { return &dict_; }

  size_t Count() const;

  // Logs one Warn line per entry still present; returns how many there were.
  size_t WarnUnused(const std::string& component, const std::string& consumer) const;

 private:
  AVDictionary* dict_ = nullptr;
};

}  // namespace avpipe::io

#endif  // AVPIPE_IO_FORMAT_OPTIONS_HPP_
