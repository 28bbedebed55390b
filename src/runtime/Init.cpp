// Repository: avpipe
// Component: Runtime Init
// Purpose: One-time native library setup: av_log level and routing of
//          native log lines into the Logger.
// Copyright (c) 2025 RetroVue

#include "avpipe/runtime/Init.hpp"

#include <atomic>
#include <cstddef>
#include <cstdarg>
#include <cstdlib>
#include <mutex>

extern "C" {
#include <libavutil/log.h>
}

#include "avpipe/util/Logger.hpp"

namespace avpipe::runtime {

namespace {

using util::Logger;

constexpr size_t kNativeLineMax = 1024;

std::once_flag g_init_once;
std::atomic<bool> g_initialized{false};

// av_log may deliver one line in several calls; the pieces are joined per
// thread until the newline arrives.
thread_local std::string t_pending_line;
thread_local int t_print_prefix = 1;

void NativeLogCallback(void* avcl, int level, const char* fmt, va_list vl) {
  if (level > av_log_get_level()) return;

  char buffer[kNativeLineMax];
  const int length =
      av_log_format_line2(avcl, level, fmt, vl, buffer, sizeof(buffer), &t_print_prefix);
  t_pending_line += buffer;
  // A truncated piece lost its newline; it ends the line regardless.
  const bool truncated = length >= static_cast<int>(sizeof(buffer));
  if (!truncated && (t_pending_line.empty() || t_pending_line.back() != '\n')) return;

  if (!t_pending_line.empty() && t_pending_line.back() == '\n') t_pending_line.pop_back();
  const std::string line = "[FFmpeg] " + t_pending_line;
  t_pending_line.clear();

  if (level <= AV_LOG_ERROR) {
    Logger::Error(line);
  } else if (level <= AV_LOG_WARNING) {
    Logger::Warn(line);
  } else if (level <= AV_LOG_INFO) {
    Logger::Info(line);
  } else {
    Logger::Debug(line);
  }
}

}  // namespace

bool ParseNativeLogLevel(const std::string& name, int& level) {
  if (name == "quiet") {
    level = AV_LOG_QUIET;
  } else if (name == "error") {
    level = AV_LOG_ERROR;
  } else if (name == "warning") {
    level = AV_LOG_WARNING;
  } else if (name == "info") {
    level = AV_LOG_INFO;
  } else if (name == "debug") {
    level = AV_LOG_DEBUG;
  } else {
    return false;
  }
  return true;
}

void Initialize(const InitOptions& options) {
  std::call_once(g_init_once, [&options]() {
    std::string name = options.native_log_level;
    if (name.empty()) {
      const char* env = std::getenv("AVPIPE_NATIVE_LOG_LEVEL");
      if (env) name = env;
    }

    int level = AV_LOG_ERROR;
    if (!name.empty() && !ParseNativeLogLevel(name, level)) {
      Logger::Warn("[Runtime] Unknown native log level '" + name + "', using error");
      level = AV_LOG_ERROR;
      name = "error";
    }
    av_log_set_level(level);
    if (options.route_native_log) av_log_set_callback(&NativeLogCallback);

    g_initialized.store(true);
    Logger::Info(std::string("[Runtime] Initialized (native log level ") +
                 (name.empty() ? "error" : name) + ", " +
                 (options.route_native_log ? "routed" : "direct") + ")");
  });
}

bool IsInitialized() {
  return g_initialized.load();
}

}  // namespace avpipe::runtime
