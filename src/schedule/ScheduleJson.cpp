// Repository: Schedcast-air
// Component: Schedule JSON Codec
// Purpose: Reads schedule payloads and writes the JSON array export form
// Copyright (c) 2025 Schedcast

#include "schedcast/schedule/ScheduleJson.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>

#include "schedcast/util/Json.hpp"

namespace schedcast::schedule {

using util::JsonValue;

namespace {

std::string GetString(const JsonValue& obj, const char* key) {
  const JsonValue* v = obj.Find(key);
  if (v == nullptr || !v->IsString()) return "";
  return v->AsString();
}

// Non-finite values ("inf", "nan", 1e400) count as missing.
std::optional<double> GetNumber(const JsonValue& obj, const char* key) {
  const JsonValue* v = obj.Find(key);
  if (v == nullptr) return std::nullopt;
  if (v->IsNumber()) {
    if (std::isfinite(v->AsNumber())) return v->AsNumber();
    return std::nullopt;
  }
  if (v->IsString() && !v->AsString().empty()) {
    const std::string& s = v->AsString();
    char* end = nullptr;
    double d = std::strtod(s.c_str(), &end);
    if (end != s.c_str() && *end == '\0' && std::isfinite(d)) return d;
  }
  return std::nullopt;
}

Track TrackFromJson(const JsonValue& obj) {
  Track t;
  t.id = GetString(obj, "track_id");
  t.legacy_id = GetString(obj, "track__id");
  t.name = GetString(obj, "track_name");
  t.locator = GetString(obj, "track_url");
  t.duration_seconds = GetNumber(obj, "track_duration_seconds");
  return t;
}

bool EventFromJson(const JsonValue& obj, size_t index, Event& out, std::string& detail) {
  if (!obj.IsObject()) {
    std::ostringstream oss;
    oss << "entry " << index << " is not an object";
    detail = oss.str();
    return false;
  }
  out.id = GetString(obj, "event_id");
  out.name = GetString(obj, "event_name");
  out.artist = GetString(obj, "artist_name");
  out.start_time = GetString(obj, "start_time_utc");
  out.end_time = GetString(obj, "end_time_utc");

  const JsonValue* tracks = obj.Find("tracks");
  if (tracks != nullptr && tracks->IsArray()) {
    for (const auto& item : tracks->Items()) {
      if (!item.IsObject()) continue;
      out.tracks.push_back(TrackFromJson(item));
    }
  }
  return true;
}

JsonValue TrackToJson(const Track& t) {
  JsonValue obj = JsonValue::Object();
  obj.Set("track__id", JsonValue::String(t.legacy_id));
  obj.Set("track_id", JsonValue::String(t.id));
  obj.Set("track_name", JsonValue::String(t.name));
  obj.Set("track_url", JsonValue::String(t.locator));
  obj.Set("track_duration_seconds",
          t.duration_seconds ? JsonValue::Number(*t.duration_seconds) : JsonValue::Null());
  return obj;
}

JsonValue EventToJson(const Event& e) {
  JsonValue obj = JsonValue::Object();
  obj.Set("event_id", JsonValue::String(e.id));
  obj.Set("event_name", JsonValue::String(e.name));
  obj.Set("artist_name", JsonValue::String(e.artist));
  obj.Set("start_time_utc", JsonValue::String(e.start_time));
  obj.Set("end_time_utc", JsonValue::String(e.end_time));
  JsonValue tracks = JsonValue::Array();
  for (const auto& t : e.tracks) {
    tracks.Push(TrackToJson(t));
  }
  obj.Set("tracks", std::move(tracks));
  return obj;
}

}  // namespace

ScheduleParseResult ParseScheduleJson(const std::string& json) {
  if (json.find_first_not_of(" \t\r\n") == std::string::npos) {
    return ScheduleParseResult::Failure(ScheduleError::kEmptySchedule,
                                        "received empty schedule payload");
  }

  auto parsed = util::ParseJson(json);
  if (!parsed.ok) {
    std::ostringstream oss;
    oss << "unable to parse schedule JSON: " << parsed.error << " at offset " << parsed.offset;
    return ScheduleParseResult::Failure(ScheduleError::kMalformedJson, oss.str());
  }

  const JsonValue* list = nullptr;
  std::vector<Event> events;
  std::string detail;

  if (parsed.value.IsArray()) {
    list = &parsed.value;
  } else if (parsed.value.IsObject()) {
    const JsonValue* wrapped = parsed.value.Find("events");
    if (wrapped != nullptr && wrapped->IsArray() && parsed.value.Find("event_id") == nullptr) {
      list = wrapped;
    } else {
      Event single;
      if (!EventFromJson(parsed.value, 0, single, detail)) {
        return ScheduleParseResult::Failure(ScheduleError::kMalformedJson, detail);
      }
      events.push_back(std::move(single));
    }
  } else {
    return ScheduleParseResult::Failure(ScheduleError::kMalformedJson,
                                        "schedule payload must be an array or object");
  }

  if (list != nullptr) {
    size_t index = 0;
    for (const auto& item : list->Items()) {
      Event e;
      if (!EventFromJson(item, index, e, detail)) {
        return ScheduleParseResult::Failure(ScheduleError::kMalformedJson, detail);
      }
      events.push_back(std::move(e));
      ++index;
    }
  }

  if (events.empty()) {
    return ScheduleParseResult::Failure(ScheduleError::kEmptySchedule,
                                        "no events found in schedule payload");
  }
  return ScheduleParseResult::Success(std::move(events));
}

std::string SerializeScheduleJson(const std::vector<Event>& events, bool pretty) {
  JsonValue arr = JsonValue::Array();
  for (const auto& e : events) {
    arr.Push(EventToJson(e));
  }
  return util::WriteJson(arr, pretty);
}

std::string SerializeScheduleJson(const Schedule& schedule, bool pretty) {
  JsonValue arr = JsonValue::Array();
  for (const auto& e : schedule.events) {
    if (e) arr.Push(EventToJson(*e));
  }
  return util::WriteJson(arr, pretty);
}

SchedulePtr MakeSchedule(std::vector<Event> events) {
  auto schedule = std::make_shared<Schedule>();
  schedule->events.reserve(events.size());
  for (auto& e : events) {
    schedule->events.push_back(std::make_shared<const Event>(std::move(e)));
  }
  return schedule;
}

}  // namespace schedcast::schedule
