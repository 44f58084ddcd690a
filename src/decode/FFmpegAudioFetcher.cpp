// Repository: Schedcast-air
// Component: FFmpeg Audio Fetcher
// Purpose: Opens track locators with libavformat and yields duration-bearing clips
// Copyright (c) 2025 Schedcast

#include "schedcast/decode/FFmpegAudioFetcher.hpp"

#include <chrono>
#include <memory>
#include <sstream>

#include "schedcast/decode/FFmpegAudioDecoder.hpp"
#include "schedcast/util/Logger.hpp"

namespace schedcast::decode {

using util::Logger;

FFmpegAudioFetcher::FFmpegAudioFetcher(AudioFetcherConfig config) : config_(std::move(config)) {}

std::string FFmpegAudioFetcher::Resolve(const std::string& locator) const {
  if (config_.base_location.empty() || locator.empty()) return locator;
  if (locator[0] == '/' || locator.find("://") != std::string::npos) return locator;

  std::string base = config_.base_location;
  if (base.back() != '/') base.push_back('/');
  return base + locator;
}

audio::AudioClipPtr FFmpegAudioFetcher::Fetch(const std::string& locator) {
  const std::string uri = Resolve(locator);

  auto open_start = std::chrono::steady_clock::now();
  FFmpegAudioDecoder decoder(AudioDecoderConfig{uri});
  if (!decoder.Open()) {
    Logger::Error("[FFmpegAudioFetcher] Failed to open: " + uri);
    return nullptr;
  }
  const double duration = decoder.DurationSeconds();
  decoder.Close();

  if (duration <= 0.0) {
    Logger::Error("[FFmpegAudioFetcher] Unknown duration for " + uri);
    return nullptr;
  }

  auto open_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - open_start)
                      .count();
  std::ostringstream oss;
  oss << "[FFmpegAudioFetcher] Opened: " << uri << " (" << duration << "s, " << open_ms
      << "ms)";
  Logger::Info(oss.str());
  return std::make_shared<FFmpegAudioClip>(uri, duration);
}

}  // namespace schedcast::decode
