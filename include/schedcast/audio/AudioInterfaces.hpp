// Repository: Schedcast-air
// Component: Audio Collaborator Interfaces
// Purpose: Seams between the playback loop and audio fetch/decode/output
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_AUDIO_INTERFACES_HPP_
#define SCHEDCAST_AUDIO_INTERFACES_HPP_

#include <memory>
#include <string>

namespace schedcast::audio {

// A fetched, decodable audio resource. The playback loop only needs its
// duration; the output implementation knows how to render it.
class IAudioClip {
 public:
  virtual ~IAudioClip() = default;

  virtual const std::string& locator() const = 0;

  // Actual media duration in seconds (may differ from schedule metadata).
  virtual double DurationSeconds() const = 0;
};

using AudioClipPtr = std::shared_ptr<const IAudioClip>;

// Resolves a locator to a clip. Returns nullptr on any failure; the
// implementation logs the reason. Locator resolution (signing, HTTP,
// format detection) is entirely the implementation's concern.
class IAudioResourceFetcher {
 public:
  virtual ~IAudioResourceFetcher() = default;
  virtual AudioClipPtr Fetch(const std::string& locator) = 0;
};

// Play/seek/stop. Play replaces whatever is currently playing and returns
// immediately; the loop waits out the duration itself.
class IAudioOutput {
 public:
  virtual ~IAudioOutput() = default;

  // Begins rendering clip from offset_seconds. Returns false if playback
  // could not be started.
  virtual bool Play(const AudioClipPtr& clip, double offset_seconds) = 0;

  // Stops rendering. Idempotent.
  virtual void Stop() = 0;
};

}  // namespace schedcast::audio

#endif  // SCHEDCAST_AUDIO_INTERFACES_HPP_
