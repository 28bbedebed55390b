// Repository: avpipe
// Component: FormatOptions
// Purpose: Named option sets for demuxers, muxers and codecs, and their
//          hand-off to FFmpeg as an AVDictionary.
// Copyright (c) 2025 RetroVue

#include "avpipe/io/FormatOptions.hpp"

#include <utility>

extern "C" {
#include <libavutil/dict.h>
}

#include "avpipe/util/Logger.hpp"

namespace avpipe::io {

using util::Logger;
using util::MediaError;

FormatOptions FragmentedMovOptions() {
  return FormatOptions{
      {"movflags", "faststart+frag_keyframe+frag_custom+empty_moov+omit_tfhd_offset"}};
}

FormatOptions RtspTransportTcpOptions() {
  return FormatOptions{{"rtsp_transport", "tcp"}};
}

FormatOptions RtspTransportTcpWithTimeoutsOptions() {
  FormatOptions options = RtspTransportTcpOptions();
  // Microseconds. The RTSP socket timeout is "timeout" since FFmpeg 5
  // (formerly "stimeout").
  options["rw_timeout"] = "16000000";
  options["timeout"] = "16000000";
  return options;
}

FormatOptions MergeOptions(FormatOptions base, const FormatOptions& overrides) {
  for (const auto& option : overrides) {
    base[option.first] = option.second;
  }
  return base;
}

NativeOptions::~NativeOptions() {
  av_dict_free(&dict_);
}

MediaError NativeOptions::Assign(const FormatOptions& options) {
  av_dict_free(&dict_);
  for (const auto& option : options) {
    MediaError err = Set(option.first, option.second);
    if (err != MediaError::kOk) return err;
  }
  return MediaError::kOk;
}

MediaError NativeOptions::Set(const std::string& key, const std::string& value) {
  int ret = av_dict_set(&dict_, key.c_str(), value.c_str(), 0);
  if (ret < 0) {
    Logger::Error("[FormatOptions] av_dict_set failed for " + key + ": " +
                  util::NativeErrorString(ret));
    return util::MapNativeError(ret, util::NativeContext::kBuffer);
  }
  return MediaError::kOk;
}

size_t NativeOptions::Count() const {
  return static_cast<size_t>(av_dict_count(dict_));
}

size_t NativeOptions::WarnUnused(const std::string& component,
                                 const std::string& consumer) const {
  size_t unused = 0;
  const AVDictionaryEntry* entry = nullptr;
  while ((entry = av_dict_get(dict_, "", entry, AV_DICT_IGNORE_SUFFIX)) != nullptr) {
    Logger::Warn("[" + component + "] Option not recognized by " + consumer + ": " +
                 entry->key + "=" + entry->value);
    ++unused;
  }
  return unused;
}

}  // namespace avpipe::io
