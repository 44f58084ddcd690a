// Repository: Schedcast-air
// Component: Playback Loop
// Purpose: Resolve/wait/play state machine driving scheduled and fallback audio
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_PLAYBACK_LOOP_HPP_
#define SCHEDCAST_PLAYBACK_LOOP_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "schedcast/audio/AudioInterfaces.hpp"
#include "schedcast/playback/FallbackPolicy.hpp"
#include "schedcast/playback/PlaybackEventBus.hpp"
#include "schedcast/playback/TrackCursor.hpp"
#include "schedcast/schedule/EventSelector.hpp"
#include "schedcast/schedule/ScheduleStore.hpp"
#include "schedcast/time/ITimeSource.hpp"
#include "schedcast/timing/IWaitStrategy.hpp"

namespace schedcast::playback {

struct PlaybackConfig {
  // Loop the default event whenever no scheduled event is active.
  bool enable_fallback = true;

  // event_id of the schedule event to use as default (case-insensitive).
  std::string default_event_id;

  // Dedicated default payload. Takes precedence over the schedule lookup.
  schedule::EventPtr default_event;

  // How often fallback playback checks for a scheduled event. Floor 1000 ms.
  int64_t fallback_check_interval_ms = 60'000;

  // Offsets this close to a clip's end skip the clip.
  double skip_epsilon_seconds = 0.01;

  // Upper bound on a single Waiting sleep, so schedule swaps are noticed.
  int64_t max_idle_wait_ms = 60'000;

  // Pause after an audio fetch or output failure before re-resolving.
  int64_t fetch_retry_backoff_ms = 5'000;
};

enum class LoopState {
  kIdle,             // Not started, or stopped
  kResolving,        // Selecting the event for "now"
  kWaiting,          // Sleeping until an upcoming event starts
  kPlaying,          // Playing a scheduled event
  kFallbackPlaying,  // Looping the default event
};

const char* LoopStateToString(LoopState state);

// Event and track are always read together under one lock.
struct PlaybackSnapshot {
  LoopState state = LoopState::kIdle;
  schedule::EventPtr active_event;
  TrackPtr current_track;
  bool is_fallback = false;
  bool running = false;
};

// =============================================================================
// PlaybackLoop
//
// Resolving → (active) Playing → Resolving
//           → (nothing active, default configured) FallbackPlaying → Resolving
//           → (upcoming) Waiting → Resolving
//           → (nothing left, no default) stop
//
// Every wait goes through the IWaitStrategy, so Stop() interrupts promptly
// and tests drive time deterministically. The schedule snapshot is taken at
// each Resolving step and never mutated mid-cycle; a replaced schedule is
// picked up at the next resolve.
//
// ActiveEventChanged fires only when (event, is_fallback) changes and is
// followed by TrackChanged(null) when a track was current. TrackChanged
// fires only when the track identity changes.
// =============================================================================

class PlaybackLoop {
 public:
  PlaybackLoop(std::shared_ptr<schedule::ScheduleStore> store,
               std::shared_ptr<time::ITimeSource> time_source,
               std::shared_ptr<audio::IAudioResourceFetcher> fetcher,
               std::shared_ptr<audio::IAudioOutput> output,
               std::shared_ptr<PlaybackEventBus> bus,
               PlaybackConfig config = {},
               std::unique_ptr<timing::IWaitStrategy> waiter = nullptr);
  ~PlaybackLoop();

  PlaybackLoop(const PlaybackLoop&) = delete;
  PlaybackLoop& operator=(const PlaybackLoop&) = delete;

  // Runs the state machine on the calling thread until the schedule is
  // exhausted (returns true) or Stop() is called (returns true).
  // Returns false without running if preconditions fail or the loop is
  // already running.
  bool Run();

  // Runs on an internal thread. A second Start while running is a no-op
  // that returns true. Returns false if preconditions fail.
  bool Start();

  // Cancels the current wait, stops audio, clears state and joins the
  // internal thread. Idempotent.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  PlaybackSnapshot Snapshot() const;

  const PlaybackConfig& config() const { return config_; }

 private:
  enum class StepResult {
    kContinue,   // Re-resolve
    kExhausted,  // Nothing active or upcoming, no fallback
    kCancelled,  // Stop requested
  };

  struct Resolved {
    schedule::ValidatedSchedule validated;
    schedule::EventPtr fallback_event;
    uint64_t version = 0;
  };

  bool CheckPreconditions() const;
  void RunLoop();
  void RequestStop();

  StepResult ResolveOnce();
  StepResult PlayFromElapsed(const schedule::EventWindow& window, int64_t elapsed_ms);
  StepResult PlayFallback(const schedule::EventPtr& fallback_event);

  // Refreshes the cached validation when the store version moved.
  const Resolved& RefreshResolved();
  bool ScheduledEventActive();
  int64_t MsUntilNextStart();

  // Stops output, clears the track, drops the active event, then waits
  // out the retry backoff (capped by cap_ms when cap_ms > 0).
  StepResult AbortAndBackoff(int64_t cap_ms);

  void SetActiveEvent(const schedule::EventPtr& event, bool is_fallback);
  void SetCurrentTrack(const TrackPtr& track);
  void SetState(LoopState state);
  void ClearPlayback();

  bool Wait(int64_t duration_ms);

  std::shared_ptr<schedule::ScheduleStore> store_;
  std::shared_ptr<time::ITimeSource> time_source_;
  std::shared_ptr<audio::IAudioResourceFetcher> fetcher_;
  std::shared_ptr<audio::IAudioOutput> output_;
  std::shared_ptr<PlaybackEventBus> bus_;
  PlaybackConfig config_;
  std::unique_ptr<timing::IWaitStrategy> waiter_;

  // Loop-thread only.
  Resolved resolved_;
  bool resolved_valid_ = false;

  mutable std::mutex state_mutex_;
  PlaybackSnapshot state_;

  std::mutex lifecycle_mutex_;
  std::thread loop_thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<std::thread::id> loop_thread_id_{};
};

}  // namespace schedcast::playback

#endif  // SCHEDCAST_PLAYBACK_LOOP_HPP_
