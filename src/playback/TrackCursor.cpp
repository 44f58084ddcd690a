// Repository: Schedcast-air
// Component: Track Cursor
// Purpose: Maps elapsed event time to a (track, offset) position
// Copyright (c) 2025 Schedcast

#include "schedcast/playback/TrackCursor.hpp"

#include <algorithm>

namespace schedcast::playback {

std::optional<TrackPosition> TrackCursor::Locate(const schedule::Event& event,
                                                 double elapsed_seconds) {
  double remaining = std::max(0.0, elapsed_seconds);

  for (size_t i = 0; i < event.tracks.size(); ++i) {
    const auto& track = event.tracks[i];
    if (!track.HasValidDuration()) {
      continue;
    }
    const double duration = *track.duration_seconds;
    if (remaining < duration) {
      return TrackPosition{i, remaining};
    }
    remaining -= duration;
  }
  return std::nullopt;
}

double TrackCursor::RemainingInTrack(const schedule::Event& event,
                                     const TrackPosition& position) {
  if (position.index >= event.tracks.size()) return 0.0;
  const double duration = event.tracks[position.index].DurationOrZero();
  return std::max(0.0, duration - position.offset_seconds);
}

}  // namespace schedcast::playback
