// Repository: Schedcast-air
// Component: Event Selector
// Purpose: Pure selection of the active or soonest-upcoming event at a timestamp
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_SCHEDULE_EVENT_SELECTOR_HPP_
#define SCHEDCAST_SCHEDULE_EVENT_SELECTOR_HPP_

#include <cstdint>
#include <optional>

#include "schedcast/schedule/ScheduleTypes.hpp"

namespace schedcast::schedule {

// =============================================================================
// Window Classification
// Mutually exclusive, exhaustive classification of a timestamp against
// one event's effective window [start, effective_end).
// =============================================================================

enum class WindowClassification {
  // now < start
  kUpcoming,

  // start <= now < effective_end
  kActive,

  // now >= effective_end
  kElapsed,
};

const char* WindowClassificationToString(WindowClassification c);

// =============================================================================
// Selection Result
// =============================================================================

enum class SelectionKind {
  kNone,      // Nothing active, nothing upcoming
  kUpcoming,  // Caller should wait wait_ms, then re-resolve
  kActive,    // Play window.event from elapsed_ms
};

const char* SelectionKindToString(SelectionKind kind);

struct SelectionResult {
  SelectionKind kind;
  std::optional<EventWindow> window;

  // kUpcoming: start - now (> 0). kActive: now - start (>= 0). kNone: 0.
  int64_t wait_ms;
  int64_t elapsed_ms;

  static SelectionResult None() {
    return {SelectionKind::kNone, std::nullopt, 0, 0};
  }

  static SelectionResult Upcoming(const EventWindow& w, int64_t now_ms) {
    return {SelectionKind::kUpcoming, w, w.start_utc_ms - now_ms, 0};
  }

  static SelectionResult Active(const EventWindow& w, int64_t now_ms) {
    return {SelectionKind::kActive, w, 0, now_ms - w.start_utc_ms};
  }

  bool IsActive() const { return kind == SelectionKind::kActive; }
  bool IsUpcoming() const { return kind == SelectionKind::kUpcoming; }
  bool IsNone() const { return kind == SelectionKind::kNone; }
};

// =============================================================================
// Event Selector
// Stateless: identical (schedule, now) always yields an identical result.
//
// Rules, in order:
//   1. Only windows that survived ScheduleValidator are considered.
//   2. An event is active when start <= now < effective_end. If several are,
//      the earliest in source order wins.
//   3. Otherwise the event with the smallest start > now is upcoming
//      (ties broken by source order).
//   4. Otherwise nothing is relevant.
// =============================================================================

class EventSelector {
 public:
  static SelectionResult Select(const ValidatedSchedule& schedule, int64_t now_ms);

  // Side-effect-free preview query for presentation layers. Same semantics
  // as Select; kept separate so callers state intent.
  static SelectionResult IsEventActiveAt(const ValidatedSchedule& schedule, int64_t at_ms) {
    return Select(schedule, at_ms);
  }

  static WindowClassification ClassifyWindow(int64_t now_ms, int64_t start_utc_ms,
                                             int64_t effective_end_utc_ms);

  // start + min(declared_end - start, total_track_seconds), in ms.
  static int64_t ComputeEffectiveEndMs(int64_t start_utc_ms, int64_t declared_end_utc_ms,
                                       double total_track_seconds);
};

}  // namespace schedcast::schedule

#endif  // SCHEDCAST_SCHEDULE_EVENT_SELECTOR_HPP_
