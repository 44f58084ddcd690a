// Repository: Schedcast-air
// Component: Playback Loop
// Purpose: Resolve/wait/play state machine driving scheduled and fallback audio
// Copyright (c) 2025 Schedcast

#include "schedcast/playback/PlaybackLoop.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "schedcast/schedule/ScheduleValidator.hpp"
#include "schedcast/schedule/Timestamp.hpp"
#include "schedcast/util/Logger.hpp"

namespace schedcast::playback {

using schedule::EventPtr;
using schedule::EventSelector;
using schedule::FormatUtcTimestampMs;
using util::Logger;

namespace {

constexpr int64_t kMinFallbackCheckIntervalMs = 1'000;

int64_t SecondsToMs(double seconds) {
  return static_cast<int64_t>(std::llround(seconds * 1000.0));
}

std::string EventLabel(const EventPtr& event) {
  return event ? event->Label() : std::string("<none>");
}

}  // namespace

const char* LoopStateToString(LoopState state) {
  switch (state) {
    case LoopState::kIdle:
      return "idle";
    case LoopState::kResolving:
      return "resolving";
    case LoopState::kWaiting:
      return "waiting";
    case LoopState::kPlaying:
      return "playing";
    case LoopState::kFallbackPlaying:
      return "fallback_playing";
  }
  return "unknown";
}

PlaybackLoop::PlaybackLoop(std::shared_ptr<schedule::ScheduleStore> store,
                           std::shared_ptr<time::ITimeSource> time_source,
                           std::shared_ptr<audio::IAudioResourceFetcher> fetcher,
                           std::shared_ptr<audio::IAudioOutput> output,
                           std::shared_ptr<PlaybackEventBus> bus,
                           PlaybackConfig config,
                           std::unique_ptr<timing::IWaitStrategy> waiter)
    : store_(std::move(store)),
      time_source_(std::move(time_source)),
      fetcher_(std::move(fetcher)),
      output_(std::move(output)),
      bus_(bus ? std::move(bus) : std::make_shared<PlaybackEventBus>()),
      config_(std::move(config)),
      waiter_(waiter ? std::move(waiter) : std::make_unique<timing::RealtimeWaitStrategy>()) {
  config_.fallback_check_interval_ms =
      std::max(kMinFallbackCheckIntervalMs, config_.fallback_check_interval_ms);
  config_.max_idle_wait_ms = std::max<int64_t>(1, config_.max_idle_wait_ms);
  config_.fetch_retry_backoff_ms = std::max<int64_t>(1, config_.fetch_retry_backoff_ms);
  config_.skip_epsilon_seconds = std::max(0.0, config_.skip_epsilon_seconds);
}

PlaybackLoop::~PlaybackLoop() {
  Stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

bool PlaybackLoop::CheckPreconditions() const {
  if (!time_source_) {
    Logger::Error("[PlaybackLoop] No time source configured");
    return false;
  }
  if (!fetcher_ || !output_) {
    Logger::Error("[PlaybackLoop] Audio fetcher and output are required");
    return false;
  }
  if (!store_) {
    Logger::Error("[PlaybackLoop] No schedule store configured");
    return false;
  }
  auto snapshot = store_->Get();
  if (!snapshot.schedule || snapshot.schedule->events.empty()) {
    Logger::Error("[PlaybackLoop] No schedule loaded; refusing to start");
    return false;
  }
  return true;
}

bool PlaybackLoop::Run() {
  if (!CheckPreconditions()) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load(std::memory_order_acquire)) {
      Logger::Warn("[PlaybackLoop] Run() called while already running");
      return false;
    }
    stop_requested_.store(false, std::memory_order_release);
    waiter_->Reset();
    running_.store(true, std::memory_order_release);
  }
  RunLoop();
  return true;
}

bool PlaybackLoop::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    Logger::Debug("[PlaybackLoop] Start() while running; ignored");
    return true;
  }
  if (!CheckPreconditions()) {
    return false;
  }
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
  stop_requested_.store(false, std::memory_order_release);
  waiter_->Reset();
  running_.store(true, std::memory_order_release);
  loop_thread_ = std::thread(&PlaybackLoop::RunLoop, this);
  return true;
}

void PlaybackLoop::Stop() {
  // Called on the loop thread (listener or collaborator callback). running_ is
  // set, so no start can clear the request; joining is left to the owner.
  if (loop_thread_id_.load(std::memory_order_acquire) == std::this_thread::get_id()) {
    RequestStop();
    return;
  }

  // Start()/Run() reset the request under this lock.
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  RequestStop();
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
}

void PlaybackLoop::RequestStop() {
  stop_requested_.store(true, std::memory_order_release);
  waiter_->Cancel();
  if (output_) {
    output_->Stop();
  }
}

void PlaybackLoop::RunLoop() {
  loop_thread_id_.store(std::this_thread::get_id(), std::memory_order_release);
  time_source_->EnsureInitialized();
  Logger::Info("[PlaybackLoop] Starting scheduled playback at " +
               FormatUtcTimestampMs(time_source_->NowUtcMs()));

  StepResult result = StepResult::kContinue;
  while (result == StepResult::kContinue &&
         !stop_requested_.load(std::memory_order_acquire)) {
    result = ResolveOnce();
  }

  ClearPlayback();
  if (result == StepResult::kExhausted) {
    Logger::Info("[PlaybackLoop] No current or upcoming events; playback finished.");
  } else {
    Logger::Info("[PlaybackLoop] Playback stopped.");
  }
  loop_thread_id_.store(std::thread::id(), std::memory_order_release);
  running_.store(false, std::memory_order_release);
}

PlaybackSnapshot PlaybackLoop::Snapshot() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  PlaybackSnapshot out = state_;
  out.running = IsRunning();
  return out;
}

// =============================================================================
// Resolving
// =============================================================================

const PlaybackLoop::Resolved& PlaybackLoop::RefreshResolved() {
  auto snapshot = store_->Get();
  if (resolved_valid_ && snapshot.version == resolved_.version) {
    return resolved_;
  }

  schedule::ScheduleValidator validator;
  resolved_.validated = validator.Validate(snapshot.schedule);
  resolved_.version = snapshot.version;
  schedule::ScheduleValidator::LogIssues(resolved_.validated, "PlaybackLoop");

  resolved_.fallback_event = nullptr;
  if (config_.enable_fallback) {
    auto fallback = FallbackPolicy::ResolveDefaultEvent(config_.default_event, snapshot.schedule,
                                                        config_.default_event_id);
    if (fallback.found()) {
      Logger::Info("[PlaybackLoop] Default event " + fallback.event->Label() + " (" +
                   FallbackOriginToString(fallback.origin) + ")");
      resolved_.fallback_event = fallback.event;
    } else {
      Logger::Warn("[PlaybackLoop] No default event found; fallback playback disabled.");
    }
  }

  resolved_valid_ = true;
  return resolved_;
}

bool PlaybackLoop::ScheduledEventActive() {
  const Resolved& resolved = RefreshResolved();
  return EventSelector::Select(resolved.validated, time_source_->NowUtcMs()).IsActive();
}

int64_t PlaybackLoop::MsUntilNextStart() {
  const Resolved& resolved = RefreshResolved();
  auto selection = EventSelector::Select(resolved.validated, time_source_->NowUtcMs());
  return selection.IsUpcoming() ? selection.wait_ms : -1;
}

PlaybackLoop::StepResult PlaybackLoop::ResolveOnce() {
  SetState(LoopState::kResolving);
  const Resolved& resolved = RefreshResolved();
  const int64_t now = time_source_->NowUtcMs();
  const auto selection = EventSelector::Select(resolved.validated, now);

  if (selection.IsActive()) {
    const schedule::EventWindow window = *selection.window;
    SetActiveEvent(window.event, false);
    SetState(LoopState::kPlaying);
    std::ostringstream oss;
    oss << "[PlaybackLoop] Event " << EventLabel(window.event) << " active ("
        << selection.elapsed_ms << "ms elapsed, ends "
        << FormatUtcTimestampMs(window.effective_end_utc_ms) << ")";
    Logger::Info(oss.str());
    return PlayFromElapsed(window, selection.elapsed_ms);
  }

  if (resolved.fallback_event) {
    const EventPtr fallback = resolved.fallback_event;
    return PlayFallback(fallback);
  }

  if (selection.IsUpcoming()) {
    SetActiveEvent(nullptr, false);
    SetState(LoopState::kWaiting);
    const int64_t wait = std::min(selection.wait_ms, config_.max_idle_wait_ms);
    Logger::Info("[PlaybackLoop] Next event " + EventLabel(selection.window->event) +
                 " starts at " + FormatUtcTimestampMs(selection.window->start_utc_ms) +
                 "; waiting " + std::to_string(wait) + "ms");
    return Wait(wait) ? StepResult::kContinue : StepResult::kCancelled;
  }

  SetActiveEvent(nullptr, false);
  return StepResult::kExhausted;
}

// =============================================================================
// Playing
// =============================================================================

PlaybackLoop::StepResult PlaybackLoop::PlayFromElapsed(const schedule::EventWindow& window,
                                                       int64_t elapsed_ms) {
  const EventPtr event = window.event;
  const auto position = TrackCursor::Locate(*event, static_cast<double>(elapsed_ms) / 1000.0);
  if (!position) {
    Logger::Warn("[PlaybackLoop] No track at " + std::to_string(elapsed_ms) +
                 "ms into " + event->Label() + "; event might be complete.");
    SetCurrentTrack(nullptr);
    return StepResult::kContinue;
  }

  const double epsilon = config_.skip_epsilon_seconds;
  bool played_any = false;

  for (size_t i = position->index; i < event->tracks.size(); ++i) {
    if (stop_requested_.load(std::memory_order_acquire)) {
      return StepResult::kCancelled;
    }

    const schedule::Track& track = event->tracks[i];
    if (!track.HasValidDuration()) {
      Logger::Debug("[PlaybackLoop] Skipping track " + track.id + " without duration");
      continue;
    }

    auto clip = fetcher_->Fetch(track.locator);
    if (!clip) {
      Logger::Error("[PlaybackLoop] Unable to fetch audio for track " + track.id + " (" +
                    track.name + ") of event " + event->Label());
      return AbortAndBackoff(window.effective_end_utc_ms - time_source_->NowUtcMs());
    }

    const double clip_seconds = clip->DurationSeconds();
    double offset = 0.0;
    if (i == position->index) {
      offset = std::clamp(position->offset_seconds, 0.0, std::max(0.0, clip_seconds - epsilon));
    }
    if (offset >= clip_seconds - epsilon) {
      Logger::Debug("[PlaybackLoop] Skipping track " + track.id + ": offset " +
                    std::to_string(offset) + "s at or past clip end");
      continue;
    }

    if (!output_->Play(clip, offset)) {
      Logger::Error("[PlaybackLoop] Output refused track " + track.id + " of event " +
                    event->Label());
      return AbortAndBackoff(window.effective_end_utc_ms - time_source_->NowUtcMs());
    }
    SetCurrentTrack(TrackPtr(event, &track));
    Logger::Info("[PlaybackLoop] Playing " + track.name + " (" + track.id + ") from " +
                 std::to_string(offset) + "s");

    const int64_t until_end_ms = window.effective_end_utc_ms - time_source_->NowUtcMs();
    if (until_end_ms <= 0) {
      output_->Stop();
      SetCurrentTrack(nullptr);
      return StepResult::kContinue;
    }

    const int64_t wait = std::min(SecondsToMs(clip_seconds - offset), until_end_ms);
    if (!Wait(wait)) {
      return StepResult::kCancelled;
    }
    played_any = true;

    if (time_source_->NowUtcMs() >= window.effective_end_utc_ms) {
      Logger::Info("[PlaybackLoop] Event " + event->Label() + " reached its end");
      output_->Stop();
      SetCurrentTrack(nullptr);
      return StepResult::kContinue;
    }
  }

  SetCurrentTrack(nullptr);

  if (!played_any) {
    // Clips shorter than their metadata: hold until the located slot ends
    // so the next resolve does not land on the same position.
    const int64_t until_end_ms = window.effective_end_utc_ms - time_source_->NowUtcMs();
    const int64_t slot_ms = SecondsToMs(TrackCursor::RemainingInTrack(*event, *position));
    const int64_t wait = std::max<int64_t>(1, std::min(slot_ms, until_end_ms));
    Logger::Debug("[PlaybackLoop] Nothing playable from current position; holding " +
                  std::to_string(wait) + "ms");
    if (!Wait(wait)) {
      return StepResult::kCancelled;
    }
  }

  Logger::Info("[PlaybackLoop] Finished track list for " + event->Label());
  return StepResult::kContinue;
}

PlaybackLoop::StepResult PlaybackLoop::PlayFallback(const EventPtr& fallback_event) {
  SetActiveEvent(fallback_event, true);
  SetState(LoopState::kFallbackPlaying);
  Logger::Info("[PlaybackLoop] No scheduled event active; playing default " +
               fallback_event->Label());

  const double epsilon = config_.skip_epsilon_seconds;

  while (!stop_requested_.load(std::memory_order_acquire)) {
    bool played_any = false;

    for (const auto& track : fallback_event->tracks) {
      if (stop_requested_.load(std::memory_order_acquire)) {
        return StepResult::kCancelled;
      }

      auto clip = fetcher_->Fetch(track.locator);
      if (!clip) {
        Logger::Error("[PlaybackLoop] Unable to fetch default track " + track.id + " (" +
                      track.name + ")");
        return AbortAndBackoff(MsUntilNextStart());
      }

      const double clip_seconds = clip->DurationSeconds();
      if (clip_seconds <= epsilon) {
        Logger::Debug("[PlaybackLoop] Skipping empty default track " + track.id);
        continue;
      }
      if (!output_->Play(clip, 0.0)) {
        Logger::Error("[PlaybackLoop] Output refused default track " + track.id);
        return AbortAndBackoff(MsUntilNextStart());
      }
      SetCurrentTrack(TrackPtr(fallback_event, &track));
      Logger::Info("[PlaybackLoop] Default playback: " + track.name + " (" + track.id + ")");
      played_any = true;

      int64_t remaining_ms = SecondsToMs(clip_seconds);
      while (remaining_ms > 0) {
        int64_t wait = std::min(config_.fallback_check_interval_ms, remaining_ms);
        const int64_t until_next = MsUntilNextStart();
        if (until_next > 0) {
          wait = std::min(wait, until_next);
        }
        if (!Wait(wait)) {
          return StepResult::kCancelled;
        }
        remaining_ms -= wait;

        if (ScheduledEventActive()) {
          Logger::Info("[PlaybackLoop] Scheduled event started; stopping default playback");
          output_->Stop();
          SetCurrentTrack(nullptr);
          SetActiveEvent(nullptr, false);
          return StepResult::kContinue;
        }
      }
    }

    if (!played_any) {
      Logger::Warn("[PlaybackLoop] Default event " + fallback_event->Label() +
                   " has no playable tracks");
      return AbortAndBackoff(MsUntilNextStart());
    }
  }
  return StepResult::kCancelled;
}

PlaybackLoop::StepResult PlaybackLoop::AbortAndBackoff(int64_t cap_ms) {
  output_->Stop();
  SetCurrentTrack(nullptr);
  SetActiveEvent(nullptr, false);

  int64_t wait = config_.fetch_retry_backoff_ms;
  if (cap_ms >= 0) {
    wait = std::min(wait, cap_ms);
  }
  wait = std::max<int64_t>(1, wait);
  return Wait(wait) ? StepResult::kContinue : StepResult::kCancelled;
}

// =============================================================================
// State / notifications
// =============================================================================

void PlaybackLoop::SetActiveEvent(const EventPtr& event, bool is_fallback) {
  TrackPtr previous_track;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.active_event == event && state_.is_fallback == is_fallback) {
      return;
    }
    previous_track = state_.current_track;
    state_.active_event = event;
    state_.is_fallback = is_fallback;
    state_.current_track = nullptr;
  }
  bus_->PublishActiveEventChanged(event, is_fallback);
  if (previous_track) {
    bus_->PublishTrackChanged(nullptr);
  }
}

void PlaybackLoop::SetCurrentTrack(const TrackPtr& track) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.current_track == track) {
      return;
    }
    state_.current_track = track;
  }
  bus_->PublishTrackChanged(track);
}

void PlaybackLoop::SetState(LoopState state) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  state_.state = state;
}

void PlaybackLoop::ClearPlayback() {
  output_->Stop();
  SetCurrentTrack(nullptr);
  SetActiveEvent(nullptr, false);
  SetState(LoopState::kIdle);
}

bool PlaybackLoop::Wait(int64_t duration_ms) {
  if (stop_requested_.load(std::memory_order_acquire)) {
    return false;
  }
  return waiter_->WaitForMs(duration_ms) && !stop_requested_.load(std::memory_order_acquire);
}

}  // namespace schedcast::playback
