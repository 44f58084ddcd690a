// Repository: Schedcast-air
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the playback, time and service threads.
// Copyright (c) 2025 Schedcast

#include "schedcast/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace schedcast::util {

std::mutex Logger::mutex_;
Logger::Sink Logger::error_sink_;
Logger::Sink Logger::warn_sink_;
Logger::Sink Logger::info_sink_;

void Logger::SetErrorSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetWarnSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetInfoSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

bool Logger::DebugEnabled() {
  return std::getenv("SCHEDCAST_DEBUG") != nullptr;
}

// Caller holds mutex_.
void Logger::Emit(std::ostream& out, const Sink& sink, const std::string& line) {
  if (sink) {
    sink(line);
  }
  out << line << '\n';
  out.flush();
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cout, info_sink_, line);
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cout, nullptr, line);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cerr, warn_sink_, line);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cerr, error_sink_, line);
}

}  // namespace schedcast::util
