// Repository: Schedcast-air
// Component: UTC Timestamps
// Purpose: ISO-8601 parsing and formatting to/from milliseconds since Unix epoch.
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_SCHEDULE_TIMESTAMP_HPP_
#define SCHEDCAST_SCHEDULE_TIMESTAMP_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace schedcast::schedule {

// Parses YYYY-MM-DD[T| ]hh:mm[:ss[.fff...]][Z|±hh:mm|±hhmm|±hh].
// A missing offset is interpreted as UTC. Fractional seconds beyond
// milliseconds are truncated. Returns nullopt on any syntax or range error.
std::optional<int64_t> ParseUtcTimestampMs(const std::string& text);

// Formats as YYYY-MM-DDThh:mm:ssZ, or YYYY-MM-DDThh:mm:ss.mmmZ when the
// value has a millisecond component.
std::string FormatUtcTimestampMs(int64_t utc_ms);

// Days since 1970-01-01 for a proleptic Gregorian civil date.
int64_t DaysFromCivil(int64_t year, unsigned month, unsigned day);

}  // namespace schedcast::schedule

#endif  // SCHEDCAST_SCHEDULE_TIMESTAMP_HPP_
