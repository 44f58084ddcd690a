// Repository: Schedcast-air
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the playback, time and service threads.
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_UTIL_LOGGER_HPP_
#define SCHEDCAST_UTIL_LOGGER_HPP_

#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>

namespace schedcast::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from the playback loop, the resync thread and gRPC
// handlers never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when SCHEDCAST_DEBUG env is set
// Warn  → stderr (data errors, degraded time source, skipped tracks)
// Error → stderr (configuration errors, unexpected faults)
//
// Test-only: the Set*Sink hooks install a callback invoked for every line of
// that level (in addition to the stream). Pass nullptr to clear.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetErrorSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetInfoSink(Sink sink);

  static bool DebugEnabled();

 private:
  static void Emit(std::ostream& out, const Sink& sink, const std::string& line);

  static std::mutex mutex_;
  static Sink error_sink_;
  static Sink warn_sink_;
  static Sink info_sink_;
};

}  // namespace schedcast::util

#endif  // SCHEDCAST_UTIL_LOGGER_HPP_
