// Repository: Schedcast-air
// Component: Schedule Model
// Purpose: Data structures for scheduled events, tracks and validated windows
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_SCHEDULE_TYPES_HPP_
#define SCHEDCAST_SCHEDULE_TYPES_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace schedcast::schedule {

// =============================================================================
// Error Codes
// Data and configuration errors detected while loading or validating a schedule
// =============================================================================

enum class ScheduleError {
  // No error
  kNone = 0,

  // Payload is not valid JSON, or not an array/object of events
  kMalformedJson,

  // Payload parsed but contains no events
  kEmptySchedule,

  // start_time_utc does not parse as ISO-8601
  kUnparseableStart,

  // end_time_utc does not parse as ISO-8601
  kUnparseableEnd,

  // end <= start
  kInvalidEventTiming,

  // Event has no tracks at all
  kEmptyTrackList,

  // A track's duration is zero, negative or missing (track is skipped)
  kMissingTrackDuration,

  // Every track lacks a usable duration; effective window is empty
  kNoPlayableAudio,

  // Schedule source could not be read (file missing, HTTP failure)
  kSourceUnavailable,
};

// Convert error code to string for logging
const char* ScheduleErrorToString(ScheduleError error);

// =============================================================================
// Track
// =============================================================================

struct Track {
  std::string id;          // track_id
  std::string legacy_id;   // track__id (secondary identifier, preserved verbatim)
  std::string name;        // track_name
  std::string locator;     // track_url: opaque, resolved by the audio fetcher

  // track_duration_seconds. nullopt when absent from the payload.
  // Values <= 0 are "unknown" and are skipped by the cursor.
  std::optional<double> duration_seconds;

  bool HasValidDuration() const {
    return duration_seconds.has_value() && *duration_seconds > 0.0;
  }

  double DurationOrZero() const {
    return HasValidDuration() ? *duration_seconds : 0.0;
  }
};

// =============================================================================
// Event
// Immutable once handed to the selector: a schedule replacement swaps whole
// snapshots, it never mutates an Event in place.
// =============================================================================

struct Event {
  std::string id;          // event_id
  std::string name;        // event_name
  std::string artist;      // artist_name
  std::string start_time;  // start_time_utc (ISO-8601 as supplied)
  std::string end_time;    // end_time_utc (ISO-8601 as supplied)
  std::vector<Track> tracks;

  // Sum of valid track durations, in seconds.
  double TotalTrackSeconds() const;

  // Human label for logs: "name (id)".
  std::string Label() const;
};

using EventPtr = std::shared_ptr<const Event>;

// A schedule snapshot: events in source order.
struct Schedule {
  std::vector<EventPtr> events;
};

using SchedulePtr = std::shared_ptr<const Schedule>;

// =============================================================================
// Validated Event Window
// Parsed once per snapshot; the selector never re-parses strings.
// =============================================================================

struct EventWindow {
  EventPtr event;
  int64_t start_utc_ms = 0;          // Parsed declared start
  int64_t declared_end_utc_ms = 0;   // Parsed declared end
  int64_t effective_end_utc_ms = 0;  // start + min(end - start, sum(track durations))
  size_t source_index = 0;           // Position in the source collection (tie-break)
};

struct ValidationIssue {
  std::string event_id;
  ScheduleError error;
  std::string detail;
  bool excluded;  // True when the event was dropped from consideration
};

struct ValidatedSchedule {
  SchedulePtr source;
  std::vector<EventWindow> windows;   // Valid events, source order preserved
  std::vector<ValidationIssue> issues;

  bool empty() const { return windows.empty(); }
};

}  // namespace schedcast::schedule

#endif  // SCHEDCAST_SCHEDULE_TYPES_HPP_
