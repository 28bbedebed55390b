// Repository: avpipe
// Component: Runtime Init
// Purpose: One-time native library setup: av_log level and routing of
//          native log lines into the Logger.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_RUNTIME_INIT_HPP_
#define AVPIPE_RUNTIME_INIT_HPP_

#include <string>

namespace avpipe::runtime {

struct InitOptions {
  // quiet|error|warning|info|debug. Empty: AVPIPE_NATIVE_LOG_LEVEL, then
  // "error".
  std::string native_log_level;

  // Route av_log output through util::Logger instead of stderr.
  bool route_native_log = true;
};

// Safe to call from any thread, any number of times; only the first call
// applies its options. Pipelines work without it (FFmpeg needs no global
// registration), but native log lines then bypass the Logger.
void Initialize(const InitOptions& options = InitOptions());

bool IsInitialized();

// Parses a level name into an AV_LOG_* value. False on unknown names.
bool ParseNativeLogLevel(const std::string& name, int& level);

}  // namespace avpipe::runtime

#endif  // AVPIPE_RUNTIME_INIT_HPP_
