// Repository: Schedcast-air
// Component: Clip Cache
// Purpose: Locator-keyed cache in front of an audio fetcher
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_AUDIO_CLIP_CACHE_HPP_
#define SCHEDCAST_AUDIO_CLIP_CACHE_HPP_

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "schedcast/audio/AudioInterfaces.hpp"

namespace schedcast::audio {

// Reads are concurrent-safe. Two concurrent misses on the same locator
// both fetch; the second insert overwrites the first with an equivalent clip.
// Failed fetches are not cached.
class ClipCache : public IAudioResourceFetcher {
 public:
  explicit ClipCache(std::shared_ptr<IAudioResourceFetcher> inner);

  AudioClipPtr Fetch(const std::string& locator) override;

  bool Contains(const std::string& locator) const;
  size_t size() const;
  void Clear();

  uint64_t hits() const { return hits_.load(std::memory_order_relaxed); }
  uint64_t misses() const { return misses_.load(std::memory_order_relaxed); }

 private:
  std::shared_ptr<IAudioResourceFetcher> inner_;
  mutable std::mutex mutex_;
  std::map<std::string, AudioClipPtr> clips_;
  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};
};

}  // namespace schedcast::audio

#endif  // SCHEDCAST_AUDIO_CLIP_CACHE_HPP_
