// Repository: Schedcast-air
// Component: Clip Cache
// Purpose: Locator-keyed cache in front of an audio fetcher
// Copyright (c) 2025 Schedcast

#include "schedcast/audio/ClipCache.hpp"

#include "schedcast/util/Logger.hpp"

namespace schedcast::audio {

ClipCache::ClipCache(std::shared_ptr<IAudioResourceFetcher> inner) : inner_(std::move(inner)) {}

AudioClipPtr ClipCache::Fetch(const std::string& locator) {
  if (locator.empty()) {
    util::Logger::Warn("[ClipCache] Empty track locator");
    return nullptr;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clips_.find(locator);
    if (it != clips_.end()) {
      hits_.fetch_add(1, std::memory_order_relaxed);
      return it->second;
    }
  }

  misses_.fetch_add(1, std::memory_order_relaxed);
  if (!inner_) {
    return nullptr;
  }
  AudioClipPtr clip = inner_->Fetch(locator);
  if (!clip) {
    return nullptr;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  clips_[locator] = clip;
  return clip;
}

bool ClipCache::Contains(const std::string& locator) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return clips_.find(locator) != clips_.end();
}

size_t ClipCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return clips_.size();
}

void ClipCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  clips_.clear();
}

}  // namespace schedcast::audio
