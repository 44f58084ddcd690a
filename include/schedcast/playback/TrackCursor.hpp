// Repository: Schedcast-air
// Component: Track Cursor
// Purpose: Maps elapsed event time to a (track, offset) position
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_PLAYBACK_TRACK_CURSOR_HPP_
#define SCHEDCAST_PLAYBACK_TRACK_CURSOR_HPP_

#include <cstddef>
#include <optional>

#include "schedcast/schedule/ScheduleTypes.hpp"

namespace schedcast::playback {

struct TrackPosition {
  size_t index = 0;             // Index into Event::tracks
  double offset_seconds = 0.0;  // Seek offset within that track, [0, duration)
};

// Walks tracks in order, subtracting each valid duration from the elapsed
// time until the remainder falls inside a track. Tracks with a missing or
// non-positive duration are skipped without consuming time. Negative
// elapsed is treated as 0. Returns nullopt when elapsed runs past the last
// valid track (the event's audio is exhausted).
class TrackCursor {
 public:
  static std::optional<TrackPosition> Locate(const schedule::Event& event,
                                              double elapsed_seconds);

  // Remaining seconds of the located track according to metadata.
  static double RemainingInTrack(const schedule::Event& event, const TrackPosition& position);
};

}  // namespace schedcast::playback

#endif  // SCHEDCAST_PLAYBACK_TRACK_CURSOR_HPP_
