// Repository: Schedcast-air
// Component: Playback Event Bus
// Purpose: Fans out active-event and track-change notifications to subscribers
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_PLAYBACK_EVENT_BUS_HPP_
#define SCHEDCAST_PLAYBACK_EVENT_BUS_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "schedcast/schedule/ScheduleTypes.hpp"

namespace schedcast::playback {

// Aliases into the owning Event, so a held track keeps its event alive.
using TrackPtr = std::shared_ptr<const schedule::Track>;

struct PlaybackListener {
  // event is null when nothing is active. is_fallback marks the default event.
  std::function<void(const schedule::EventPtr& event, bool is_fallback)> on_active_event_changed;

  // track is null when playback of a track ends or the event changes.
  std::function<void(const TrackPtr& track)> on_track_changed;
};

// Callbacks run on the publishing thread (the playback loop), outside the
// bus lock. A subscriber may unsubscribe from inside its own callback.
class PlaybackEventBus {
 public:
  uint64_t Subscribe(PlaybackListener listener);
  void Unsubscribe(uint64_t id);
  size_t subscriber_count() const;

  void PublishActiveEventChanged(const schedule::EventPtr& event, bool is_fallback);
  void PublishTrackChanged(const TrackPtr& track);

 private:
  std::vector<PlaybackListener> SnapshotListeners() const;

  mutable std::mutex mutex_;
  std::vector<std::pair<uint64_t, PlaybackListener>> listeners_;
  uint64_t next_id_ = 1;
};

}  // namespace schedcast::playback

#endif  // SCHEDCAST_PLAYBACK_EVENT_BUS_HPP_
