// Repository: Schedcast-air
// Component: Schedule Builders (test only)
// Purpose: Compact construction of events and snapshots for contract tests.
// Copyright (c) 2025 Schedcast

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "schedcast/schedule/ScheduleJson.hpp"
#include "schedcast/schedule/ScheduleTypes.hpp"
#include "schedcast/schedule/Timestamp.hpp"

namespace schedcast::testing {

// 2025-01-01T00:00:00Z
inline constexpr int64_t kBaseUtcMs = 1'735'689'600'000;

inline schedule::Track MakeTrack(const std::string& id, std::optional<double> seconds,
                                 const std::string& locator = "") {
  schedule::Track t;
  t.id = id;
  t.legacy_id = "legacy-" + id;
  t.name = "Track " + id;
  t.locator = locator.empty() ? "audio/" + id + ".mp3" : locator;
  t.duration_seconds = seconds;
  return t;
}

// Event spanning [base + start_offset_ms, base + end_offset_ms).
inline schedule::Event MakeEvent(const std::string& id, int64_t start_offset_ms,
                                 int64_t end_offset_ms, std::vector<schedule::Track> tracks,
                                 const std::string& name = "") {
  schedule::Event e;
  e.id = id;
  e.name = name.empty() ? "Event " + id : name;
  e.artist = "Artist " + id;
  e.start_time = schedule::FormatUtcTimestampMs(kBaseUtcMs + start_offset_ms);
  e.end_time = schedule::FormatUtcTimestampMs(kBaseUtcMs + end_offset_ms);
  e.tracks = std::move(tracks);
  return e;
}

inline schedule::SchedulePtr MakeSnapshot(std::vector<schedule::Event> events) {
  return schedule::MakeSchedule(std::move(events));
}

}  // namespace schedcast::testing
