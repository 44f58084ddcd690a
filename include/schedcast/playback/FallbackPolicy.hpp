// Repository: Schedcast-air
// Component: Fallback Policy
// Purpose: Resolves the default (fallback) event from configuration and schedule
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_PLAYBACK_FALLBACK_POLICY_HPP_
#define SCHEDCAST_PLAYBACK_FALLBACK_POLICY_HPP_

#include <string>

#include "schedcast/schedule/ScheduleTypes.hpp"

namespace schedcast::playback {

enum class FallbackOrigin {
  kNone,         // No usable default event
  kExplicit,     // Dedicated default payload supplied by configuration
  kIdMatch,      // Schedule event whose event_id matches the configured id
  kNameMatch,    // Schedule event named "default"
};

const char* FallbackOriginToString(FallbackOrigin origin);

struct FallbackResolution {
  schedule::EventPtr event;
  FallbackOrigin origin = FallbackOrigin::kNone;

  bool found() const { return event != nullptr; }
};

// Resolution order: explicit payload, then event_id match (case-insensitive),
// then an event whose trimmed name is "default" (case-insensitive).
// Candidates without any tracks are passed over. Timestamps of the default
// event are ignored; it is played as a looped playlist.
class FallbackPolicy {
 public:
  static FallbackResolution ResolveDefaultEvent(const schedule::EventPtr& explicit_default,
                                                const schedule::SchedulePtr& schedule,
                                                const std::string& default_event_id);

  static bool EqualsIgnoreCase(const std::string& a, const std::string& b);
  static std::string Trim(const std::string& s);
};

}  // namespace schedcast::playback

#endif  // SCHEDCAST_PLAYBACK_FALLBACK_POLICY_HPP_
