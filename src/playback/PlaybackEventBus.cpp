// Repository: Schedcast-air
// Component: Playback Event Bus
// Purpose: Fans out active-event and track-change notifications to subscribers
// Copyright (c) 2025 Schedcast

#include "schedcast/playback/PlaybackEventBus.hpp"

#include <algorithm>

namespace schedcast::playback {

uint64_t PlaybackEventBus::Subscribe(PlaybackListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  const uint64_t id = next_id_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void PlaybackEventBus::Unsubscribe(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [id](const auto& entry) { return entry.first == id; }),
                   listeners_.end());
}

size_t PlaybackEventBus::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.size();
}

std::vector<PlaybackListener> PlaybackEventBus::SnapshotListeners() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PlaybackListener> out;
  out.reserve(listeners_.size());
  for (const auto& entry : listeners_) out.push_back(entry.second);
  return out;
}

void PlaybackEventBus::PublishActiveEventChanged(const schedule::EventPtr& event,
                                                 bool is_fallback) {
  for (const auto& listener : SnapshotListeners()) {
    if (listener.on_active_event_changed) {
      listener.on_active_event_changed(event, is_fallback);
    }
  }
}

void PlaybackEventBus::PublishTrackChanged(const TrackPtr& track) {
  for (const auto& listener : SnapshotListeners()) {
    if (listener.on_track_changed) {
      listener.on_track_changed(track);
    }
  }
}

}  // namespace schedcast::playback
