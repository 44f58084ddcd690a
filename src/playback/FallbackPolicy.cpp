// Repository: Schedcast-air
// Component: Fallback Policy
// Purpose: Resolves the default (fallback) event from configuration and schedule
// Copyright (c) 2025 Schedcast

#include "schedcast/playback/FallbackPolicy.hpp"

#include <cctype>

#include "schedcast/util/Logger.hpp"

namespace schedcast::playback {

using util::Logger;

const char* FallbackOriginToString(FallbackOrigin origin) {
  switch (origin) {
    case FallbackOrigin::kNone:
      return "none";
    case FallbackOrigin::kExplicit:
      return "explicit";
    case FallbackOrigin::kIdMatch:
      return "id_match";
    case FallbackOrigin::kNameMatch:
      return "name_match";
  }
  return "unknown";
}

bool FallbackPolicy::EqualsIgnoreCase(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::string FallbackPolicy::Trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

FallbackResolution FallbackPolicy::ResolveDefaultEvent(const schedule::EventPtr& explicit_default,
                                                      const schedule::SchedulePtr& schedule,
                                                      const std::string& default_event_id) {
  if (explicit_default) {
    if (!explicit_default->tracks.empty()) {
      return {explicit_default, FallbackOrigin::kExplicit};
    }
    Logger::Warn("[FallbackPolicy] Default payload " + explicit_default->Label() +
                 " has no tracks; searching the schedule instead.");
  }

  if (!schedule) {
    return {};
  }

  const std::string wanted_id = Trim(default_event_id);
  if (!wanted_id.empty()) {
    for (const auto& event : schedule->events) {
      if (event && !event->tracks.empty() && EqualsIgnoreCase(event->id, wanted_id)) {
        return {event, FallbackOrigin::kIdMatch};
      }
    }
  }

  for (const auto& event : schedule->events) {
    if (event && !event->tracks.empty() && EqualsIgnoreCase(Trim(event->name), "default")) {
      return {event, FallbackOrigin::kNameMatch};
    }
  }

  return {};
}

}  // namespace schedcast::playback
