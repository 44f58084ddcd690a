// Repository: Schedcast-air
// Component: Schedule JSON Codec
// Purpose: Reads schedule payloads and writes the JSON array export form
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_SCHEDULE_JSON_HPP_
#define SCHEDCAST_SCHEDULE_JSON_HPP_

#include <string>
#include <vector>

#include "schedcast/schedule/ScheduleTypes.hpp"

namespace schedcast::schedule {

struct ScheduleParseResult {
  bool ok;
  ScheduleError error;
  std::string detail;
  std::vector<Event> events;

  static ScheduleParseResult Success(std::vector<Event> evts) {
    return {true, ScheduleError::kNone, "", std::move(evts)};
  }

  static ScheduleParseResult Failure(ScheduleError err, const std::string& detail = "") {
    return {false, err, detail, {}};
  }
};

// Accepted payload shapes:
//   [ {event}, {event}, ... ]
//   {event}                         (single event)
//   { "events": [ {event}, ... ] }  (wrapped list)
// Missing string fields read as empty; a missing or non-numeric
// track_duration_seconds reads as unknown. Timestamps are NOT parsed here;
// that is ScheduleValidator's job.
ScheduleParseResult ParseScheduleJson(const std::string& json);

// Writes a JSON array of event objects. Every field, including nested
// tracks and the legacy track__id, round-trips through ParseScheduleJson.
std::string SerializeScheduleJson(const std::vector<Event>& events, bool pretty = true);
std::string SerializeScheduleJson(const Schedule& schedule, bool pretty = true);

// Wraps parsed events as an immutable snapshot.
SchedulePtr MakeSchedule(std::vector<Event> events);

}  // namespace schedcast::schedule

#endif  // SCHEDCAST_SCHEDULE_JSON_HPP_
