// Repository: Schedcast-air
// Component: Schedule Validator
// Purpose: Classifies per-event data errors before events reach the selector
// Copyright (c) 2025 Schedcast

#include "schedcast/schedule/ScheduleValidator.hpp"

#include <sstream>

#include "schedcast/schedule/EventSelector.hpp"
#include "schedcast/schedule/Timestamp.hpp"
#include "schedcast/util/Logger.hpp"

namespace schedcast::schedule {

ValidatedSchedule ScheduleValidator::Validate(const SchedulePtr& schedule) const {
  ValidatedSchedule result;
  result.source = schedule;
  if (!schedule) {
    return result;
  }

  for (size_t i = 0; i < schedule->events.size(); ++i) {
    const EventPtr& event = schedule->events[i];
    if (!event) continue;

    EventWindow window;
    window.event = event;
    window.source_index = i;

    if (!ValidateTiming(*event, window, result.issues)) continue;
    if (!ValidateTracks(*event, result.issues)) continue;

    window.effective_end_utc_ms = EventSelector::ComputeEffectiveEndMs(
        window.start_utc_ms, window.declared_end_utc_ms, event->TotalTrackSeconds());
    if (window.effective_end_utc_ms <= window.start_utc_ms) {
      result.issues.push_back({event->id, ScheduleError::kNoPlayableAudio,
                               "effective window is empty", true});
      continue;
    }

    result.windows.push_back(std::move(window));
  }

  return result;
}

bool ScheduleValidator::ValidateTiming(const Event& event, EventWindow& window,
                                       std::vector<ValidationIssue>& issues) const {
  auto start = ParseUtcTimestampMs(event.start_time);
  if (!start) {
    issues.push_back({event.id, ScheduleError::kUnparseableStart,
                      "unparseable start_time_utc '" + event.start_time + "'", true});
    return false;
  }

  auto end = ParseUtcTimestampMs(event.end_time);
  if (!end) {
    issues.push_back({event.id, ScheduleError::kUnparseableEnd,
                      "unparseable end_time_utc '" + event.end_time + "'", true});
    return false;
  }

  if (*end <= *start) {
    std::ostringstream oss;
    oss << "end_time_utc " << event.end_time << " is not after start_time_utc "
        << event.start_time;
    issues.push_back({event.id, ScheduleError::kInvalidEventTiming, oss.str(), true});
    return false;
  }

  window.start_utc_ms = *start;
  window.declared_end_utc_ms = *end;
  return true;
}

bool ScheduleValidator::ValidateTracks(const Event& event,
                                       std::vector<ValidationIssue>& issues) const {
  if (event.tracks.empty()) {
    issues.push_back({event.id, ScheduleError::kEmptyTrackList, "event has no tracks", true});
    return false;
  }

  bool any_playable = false;
  for (size_t i = 0; i < event.tracks.size(); ++i) {
    const Track& t = event.tracks[i];
    if (t.HasValidDuration()) {
      any_playable = true;
      continue;
    }
    std::ostringstream oss;
    oss << "track[" << i << "] '" << t.name << "' has ";
    if (t.duration_seconds) {
      oss << "non-positive duration " << *t.duration_seconds << "s";
    } else {
      oss << "no duration";
    }
    oss << " and will be skipped";
    issues.push_back({event.id, ScheduleError::kMissingTrackDuration, oss.str(), false});
  }

  if (!any_playable) {
    issues.push_back({event.id, ScheduleError::kNoPlayableAudio,
                      "no track has a positive duration", true});
    return false;
  }
  return true;
}

void ScheduleValidator::LogIssues(const ValidatedSchedule& validated, const std::string& tag) {
  for (const auto& issue : validated.issues) {
    std::ostringstream oss;
    oss << "[" << tag << "] " << (issue.excluded ? "Skipping event" : "Event") << " '"
        << issue.event_id << "': " << ScheduleErrorToString(issue.error) << " ("
        << issue.detail << ")";
    util::Logger::Warn(oss.str());
  }
}

}  // namespace schedcast::schedule
