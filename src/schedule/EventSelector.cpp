// Repository: Schedcast-air
// Component: Event Selector
// Purpose: Pure selection of the active or soonest-upcoming event at a timestamp
// Copyright (c) 2025 Schedcast

#include "schedcast/schedule/EventSelector.hpp"

#include <algorithm>
#include <cmath>

namespace schedcast::schedule {

const char* WindowClassificationToString(WindowClassification c) {
  switch (c) {
    case WindowClassification::kUpcoming:
      return "UPCOMING";
    case WindowClassification::kActive:
      return "ACTIVE";
    case WindowClassification::kElapsed:
      return "ELAPSED";
  }
  return "UNKNOWN";
}

const char* SelectionKindToString(SelectionKind kind) {
  switch (kind) {
    case SelectionKind::kNone:
      return "none";
    case SelectionKind::kUpcoming:
      return "upcoming";
    case SelectionKind::kActive:
      return "active";
  }
  return "unknown";
}

WindowClassification EventSelector::ClassifyWindow(int64_t now_ms, int64_t start_utc_ms,
                                                   int64_t effective_end_utc_ms) {
  if (now_ms < start_utc_ms) {
    return WindowClassification::kUpcoming;
  }
  if (now_ms < effective_end_utc_ms) {
    return WindowClassification::kActive;
  }
  return WindowClassification::kElapsed;
}

int64_t EventSelector::ComputeEffectiveEndMs(int64_t start_utc_ms, int64_t declared_end_utc_ms,
                                             double total_track_seconds) {
  const int64_t declared_span = declared_end_utc_ms - start_utc_ms;
  if (declared_span <= 0 || !(total_track_seconds > 0.0)) {
    return start_utc_ms;
  }
  // Track sums can exceed any realistic slot; clamp before converting.
  const double track_ms_d = std::min(total_track_seconds * 1000.0,
                                     static_cast<double>(declared_span));
  const int64_t track_ms = static_cast<int64_t>(std::llround(track_ms_d));
  return start_utc_ms + std::min(declared_span, track_ms);
}

SelectionResult EventSelector::Select(const ValidatedSchedule& schedule, int64_t now_ms) {
  const EventWindow* upcoming = nullptr;

  for (const auto& w : schedule.windows) {
    switch (ClassifyWindow(now_ms, w.start_utc_ms, w.effective_end_utc_ms)) {
      case WindowClassification::kActive:
        // First active in source order wins.
        return SelectionResult::Active(w, now_ms);
      case WindowClassification::kUpcoming:
        if (upcoming == nullptr || w.start_utc_ms < upcoming->start_utc_ms) {
          upcoming = &w;
        }
        break;
      case WindowClassification::kElapsed:
        break;
    }
  }

  if (upcoming != nullptr) {
    return SelectionResult::Upcoming(*upcoming, now_ms);
  }
  return SelectionResult::None();
}

}  // namespace schedcast::schedule
