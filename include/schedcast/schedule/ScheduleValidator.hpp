// Repository: Schedcast-air
// Component: Schedule Validator
// Purpose: Classifies per-event data errors before events reach the selector
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_SCHEDULE_VALIDATOR_HPP_
#define SCHEDCAST_SCHEDULE_VALIDATOR_HPP_

#include <string>

#include "schedcast/schedule/ScheduleTypes.hpp"

namespace schedcast::schedule {

// =============================================================================
// Schedule Validator
// Per-event, skip-and-continue: one bad entry never invalidates the snapshot.
//
// Excluded (never active, never upcoming):
//   - start_time_utc unparseable          → kUnparseableStart
//   - end_time_utc unparseable            → kUnparseableEnd
//   - end <= start                        → kInvalidEventTiming
//   - no tracks                           → kEmptyTrackList
//   - no track with duration > 0          → kNoPlayableAudio
// Reported, event kept:
//   - individual track duration missing/<= 0 → kMissingTrackDuration
// =============================================================================

class ScheduleValidator {
 public:
  ValidatedSchedule Validate(const SchedulePtr& schedule) const;

  // Emits one Warn line per issue, tagged with the caller's component.
  static void LogIssues(const ValidatedSchedule& validated, const std::string& tag);

 private:
  // Individual validation steps (fail fast on first excluding error)

  bool ValidateTiming(const Event& event, EventWindow& window,
                      std::vector<ValidationIssue>& issues) const;

  bool ValidateTracks(const Event& event, std::vector<ValidationIssue>& issues) const;
};

}  // namespace schedcast::schedule

#endif  // SCHEDCAST_SCHEDULE_VALIDATOR_HPP_
