// Repository: Schedcast-air
// Component: ScheduledPlayout gRPC Service Implementation
// Purpose: Presentation and control surface over the playback loop and schedule store.
// Copyright (c) 2025 Schedcast

#include "playout_status_service.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <utility>

#include "schedcast/playback/TrackCursor.hpp"
#include "schedcast/schedule/EventSelector.hpp"
#include "schedcast/schedule/ScheduleJson.hpp"
#include "schedcast/schedule/ScheduleValidator.hpp"
#include "schedcast/schedule/Timestamp.hpp"
#include "schedcast/util/Logger.hpp"

namespace schedcast {
namespace air {

namespace {

constexpr char kApiVersion[] = "1.0.0";

void FillEventInfo(const schedule::Event& event, v1::EventInfo* out) {
  out->set_event_id(event.id);
  out->set_event_name(event.name);
  out->set_artist_name(event.artist);
  out->set_start_time_utc(event.start_time);
  out->set_end_time_utc(event.end_time);
  out->set_track_count(static_cast<int32_t>(event.tracks.size()));
}

void FillTrackInfo(const schedule::Track& track, v1::TrackInfo* out) {
  out->set_track_id(track.id);
  out->set_track_legacy_id(track.legacy_id);
  out->set_track_name(track.name);
  out->set_track_url(track.locator);
  out->set_duration_seconds(track.DurationOrZero());
}

// Per-stream mailbox; filled on the playback thread, drained by the RPC thread.
struct Subscription {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<v1::PlaybackEvent> queue;

  void Push(v1::PlaybackEvent event) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      queue.push_back(std::move(event));
    }
    cv.notify_one();
  }
};

}  // namespace

ScheduledPlayoutImpl::ScheduledPlayoutImpl(std::shared_ptr<schedule::ScheduleStore> store,
                                           std::shared_ptr<playback::PlaybackEventBus> bus,
                                           std::shared_ptr<time::ITimeSource> time_source,
                                           std::shared_ptr<playback::PlaybackLoop> loop,
                                           std::shared_ptr<time::UtcTimeSync> time_sync)
    : store_(std::move(store)),
      bus_(std::move(bus)),
      time_source_(std::move(time_source)),
      loop_(std::move(loop)),
      time_sync_(std::move(time_sync)) {
  util::Logger::Info(std::string("[ScheduledPlayoutImpl] Service initialized (API version: ") +
                     kApiVersion + ")");
}

ScheduledPlayoutImpl::~ScheduledPlayoutImpl() {
  Shutdown();
}

void ScheduledPlayoutImpl::Shutdown() {
  shutting_down_.store(true, std::memory_order_release);
}

grpc::Status ScheduledPlayoutImpl::GetVersion(grpc::ServerContext* /*context*/,
                                              const v1::ApiVersionRequest* /*request*/,
                                              v1::ApiVersion* response) {
  response->set_version(kApiVersion);
  return grpc::Status::OK;
}

grpc::Status ScheduledPlayoutImpl::GetStatus(grpc::ServerContext* /*context*/,
                                             const v1::GetStatusRequest* /*request*/,
                                             v1::PlaybackStatus* response) {
  if (loop_) {
    const auto snapshot = loop_->Snapshot();
    response->set_state(playback::LoopStateToString(snapshot.state));
    response->set_running(snapshot.running);
    if (snapshot.active_event) {
      response->set_has_active_event(true);
      FillEventInfo(*snapshot.active_event, response->mutable_active_event());
      response->set_is_fallback(snapshot.is_fallback);
    }
    if (snapshot.current_track) {
      response->set_has_current_track(true);
      FillTrackInfo(*snapshot.current_track, response->mutable_current_track());
    }
  } else {
    response->set_state(playback::LoopStateToString(playback::LoopState::kIdle));
  }

  if (time_source_) {
    response->set_now_utc(schedule::FormatUtcTimestampMs(time_source_->NowUtcMs()));
  }
  if (time_sync_) {
    response->set_time_synced(time_sync_->IsReady());
    response->set_mock_time(time_sync_->IsMockTime());
  }
  if (store_) {
    response->set_schedule_version(store_->version());
  }
  return grpc::Status::OK;
}

grpc::Status ScheduledPlayoutImpl::QueryEventAt(grpc::ServerContext* /*context*/,
                                                const v1::QueryEventAtRequest* request,
                                                v1::QueryEventAtResponse* response) {
  int64_t at_ms = 0;
  if (request->at_utc().empty()) {
    if (!time_source_) {
      return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "no time source configured");
    }
    at_ms = time_source_->NowUtcMs();
  } else {
    auto parsed = schedule::ParseUtcTimestampMs(request->at_utc());
    if (!parsed) {
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                          "unparseable timestamp '" + request->at_utc() + "'");
    }
    at_ms = *parsed;
  }

  schedule::ScheduleValidator validator;
  const auto validated = validator.Validate(store_ ? store_->Get().schedule : nullptr);
  const auto selection = schedule::EventSelector::IsEventActiveAt(validated, at_ms);

  response->set_kind(schedule::SelectionKindToString(selection.kind));
  response->set_track_index(-1);
  if (!selection.window) {
    return grpc::Status::OK;
  }

  const auto& window = *selection.window;
  FillEventInfo(*window.event, response->mutable_event());
  response->set_elapsed_ms(selection.elapsed_ms);
  response->set_wait_ms(selection.wait_ms);
  response->set_effective_end_utc(schedule::FormatUtcTimestampMs(window.effective_end_utc_ms));

  if (selection.IsActive()) {
    auto position = playback::TrackCursor::Locate(
        *window.event, static_cast<double>(selection.elapsed_ms) / 1000.0);
    if (position) {
      response->set_track_index(static_cast<int32_t>(position->index));
      response->set_track_offset_seconds(position->offset_seconds);
    }
  }
  return grpc::Status::OK;
}

grpc::Status ScheduledPlayoutImpl::SubscribePlaybackEvents(
    grpc::ServerContext* context, const v1::SubscribePlaybackEventsRequest* /*request*/,
    grpc::ServerWriter<v1::PlaybackEvent>* writer) {
  if (!bus_) {
    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "no playback bus configured");
  }

  auto subscription = std::make_shared<Subscription>();

  playback::PlaybackListener listener;
  listener.on_active_event_changed = [this, subscription](const schedule::EventPtr& event,
                                                          bool is_fallback) {
    v1::PlaybackEvent out;
    out.set_sequence(next_sequence_.fetch_add(1));
    auto* changed = out.mutable_active_event_changed();
    changed->set_is_fallback(is_fallback);
    if (event) {
      changed->set_has_event(true);
      FillEventInfo(*event, changed->mutable_event());
    }
    subscription->Push(std::move(out));
  };
  listener.on_track_changed = [this, subscription](const playback::TrackPtr& track) {
    v1::PlaybackEvent out;
    out.set_sequence(next_sequence_.fetch_add(1));
    auto* changed = out.mutable_track_changed();
    if (track) {
      changed->set_has_track(true);
      FillTrackInfo(*track, changed->mutable_track());
    }
    subscription->Push(std::move(out));
  };

  const uint64_t id = bus_->Subscribe(std::move(listener));
  util::Logger::Info("[SubscribePlaybackEvents] Subscriber " + std::to_string(id) + " attached");

  while (!context->IsCancelled() && !shutting_down_.load(std::memory_order_acquire)) {
    std::deque<v1::PlaybackEvent> batch;
    {
      std::unique_lock<std::mutex> lock(subscription->mutex);
      subscription->cv.wait_for(lock, std::chrono::milliseconds(100),
                                [&subscription] { return !subscription->queue.empty(); });
      batch.swap(subscription->queue);
    }
    bool write_failed = false;
    for (const auto& event : batch) {
      if (!writer->Write(event)) {
        write_failed = true;
        break;
      }
    }
    if (write_failed) break;
  }

  bus_->Unsubscribe(id);
  util::Logger::Info("[SubscribePlaybackEvents] Subscriber " + std::to_string(id) + " detached");
  return grpc::Status::OK;
}

grpc::Status ScheduledPlayoutImpl::ReplaceSchedule(grpc::ServerContext* /*context*/,
                                                   const v1::ReplaceScheduleRequest* request,
                                                   v1::ReplaceScheduleResponse* response) {
  if (!store_) {
    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "no schedule store configured");
  }

  auto parsed = schedule::ParseScheduleJson(request->schedule_json());
  if (!parsed.ok) {
    const std::string message =
        std::string(schedule::ScheduleErrorToString(parsed.error)) + ": " + parsed.detail;
    response->set_success(false);
    response->set_message(message);
    util::Logger::Warn("[ReplaceSchedule] Rejected: " + message);
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, message);
  }

  auto schedule_ptr = schedule::MakeSchedule(std::move(parsed.events));
  schedule::ScheduleValidator validator;
  const auto validated = validator.Validate(schedule_ptr);
  schedule::ScheduleValidator::LogIssues(validated, "ReplaceSchedule");

  for (const auto& issue : validated.issues) {
    auto* out = response->add_issues();
    out->set_event_id(issue.event_id);
    out->set_error(schedule::ScheduleErrorToString(issue.error));
    out->set_detail(issue.detail);
    out->set_excluded(issue.excluded);
  }

  const int32_t event_count = static_cast<int32_t>(schedule_ptr->events.size());
  const uint64_t version = store_->Replace(schedule_ptr);

  response->set_success(true);
  response->set_version(version);
  response->set_event_count(event_count);
  response->set_valid_event_count(static_cast<int32_t>(validated.windows.size()));
  response->set_message("installed schedule v" + std::to_string(version));
  return grpc::Status::OK;
}

grpc::Status ScheduledPlayoutImpl::ExportSchedule(grpc::ServerContext* /*context*/,
                                                  const v1::ExportScheduleRequest* /*request*/,
                                                  v1::ExportScheduleResponse* response) {
  if (!store_) {
    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "no schedule store configured");
  }
  const auto snapshot = store_->Get();
  response->set_version(snapshot.version);
  response->set_schedule_json(snapshot.schedule ? schedule::SerializeScheduleJson(*snapshot.schedule)
                                                : std::string("[]"));
  return grpc::Status::OK;
}

}  // namespace air
}  // namespace schedcast
