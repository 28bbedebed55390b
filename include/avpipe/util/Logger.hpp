// Repository: avpipe
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; one whole line per call.
// Copyright (c) 2025 RetroVue

#ifndef AVPIPE_UTIL_LOGGER_HPP_
#define AVPIPE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace avpipe::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from concurrent threads never interleave
// (pipeline threads, worker pool, native av_log callback).
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when AVPIPE_DEBUG env is set (verbose investigation)
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (native failures, closed pipelines)
//
// Test-only: SetErrorSink / SetWarnSink / SetInfoSink install a callback
// invoked for every Error() / Warn() / Info() line (in addition to the stream). Used by contract tests
// to assert that failures are reported and not swallowed.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // True when AVPIPE_DEBUG is set; lets callers skip building debug strings.
  static bool DebugEnabled();

  // Test-only: set to capture Error() lines. Call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);

  // Test-only: set to capture Warn() lines. Call with nullptr to clear.
  static void SetWarnSink(std::function<void(const std::string&)> sink);

  // Test-only: set to capture Info() lines. Call with nullptr to clear.
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace avpipe::util

#endif  // AVPIPE_UTIL_LOGGER_HPP_
