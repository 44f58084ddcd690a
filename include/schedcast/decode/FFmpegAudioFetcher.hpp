// Repository: Schedcast-air
// Component: FFmpeg Audio Fetcher
// Purpose: Opens track locators with libavformat and yields duration-bearing clips
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_DECODE_FFMPEG_AUDIO_FETCHER_HPP_
#define SCHEDCAST_DECODE_FFMPEG_AUDIO_FETCHER_HPP_

#include <string>
#include <utility>

#include "schedcast/audio/AudioInterfaces.hpp"

namespace schedcast::decode {

// Clip backed by a libavformat-readable locator. Decoding happens in the
// output; the clip only carries what the container header reports.
class FFmpegAudioClip : public audio::IAudioClip {
 public:
  FFmpegAudioClip(std::string locator, double duration_seconds)
      : locator_(std::move(locator)), duration_seconds_(duration_seconds) {}

  const std::string& locator() const override { return locator_; }
  double DurationSeconds() const override { return duration_seconds_; }

 private:
  std::string locator_;
  double duration_seconds_;
};

struct AudioFetcherConfig {
  // Prepended to locators that are neither absolute paths nor URLs.
  std::string base_location;
};

class FFmpegAudioFetcher : public audio::IAudioResourceFetcher {
 public:
  explicit FFmpegAudioFetcher(AudioFetcherConfig config = {});

  audio::AudioClipPtr Fetch(const std::string& locator) override;

  // Applies base_location to relative locators.
  std::string Resolve(const std::string& locator) const;

 private:
  AudioFetcherConfig config_;
};

}  // namespace schedcast::decode

#endif  // SCHEDCAST_DECODE_FFMPEG_AUDIO_FETCHER_HPP_
