// Repository: Schedcast-air
// Component: Schedule Model
// Purpose: Error names and event helpers
// Copyright (c) 2025 Schedcast

#include "schedcast/schedule/ScheduleTypes.hpp"

namespace schedcast::schedule {

const char* ScheduleErrorToString(ScheduleError error) {
  switch (error) {
    case ScheduleError::kNone:
      return "NONE";
    case ScheduleError::kMalformedJson:
      return "MALFORMED_JSON";
    case ScheduleError::kEmptySchedule:
      return "EMPTY_SCHEDULE";
    case ScheduleError::kUnparseableStart:
      return "UNPARSEABLE_START";
    case ScheduleError::kUnparseableEnd:
      return "UNPARSEABLE_END";
    case ScheduleError::kInvalidEventTiming:
      return "INVALID_EVENT_TIMING";
    case ScheduleError::kEmptyTrackList:
      return "EMPTY_TRACK_LIST";
    case ScheduleError::kMissingTrackDuration:
      return "MISSING_TRACK_DURATION";
    case ScheduleError::kNoPlayableAudio:
      return "NO_PLAYABLE_AUDIO";
    case ScheduleError::kSourceUnavailable:
      return "SOURCE_UNAVAILABLE";
  }
  return "UNKNOWN";
}

double Event::TotalTrackSeconds() const {
  double total = 0.0;
  for (const auto& t : tracks) {
    total += t.DurationOrZero();
  }
  return total;
}

std::string Event::Label() const {
  if (name.empty()) return id.empty() ? "<unnamed>" : id;
  if (id.empty()) return name;
  return name + " (" + id + ")";
}

}  // namespace schedcast::schedule
