// Repository: Schedcast-air
// Component: ScheduledPlayout Service Contract Tests
// Purpose: Exercises every RPC over an in-process gRPC channel.
// Copyright (c) 2025 Schedcast

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>
#include <gtest/gtest.h>

#include "playout_status_service.h"
#include "schedcast.grpc.pb.h"
#include "schedcast/playback/PlaybackEventBus.hpp"
#include "schedcast/schedule/ScheduleStore.hpp"
#include "schedcast/schedule/Timestamp.hpp"
#include "../../support/DeterministicTimeSource.hpp"
#include "../../support/ScheduleBuilders.hpp"

namespace schedcast::air {
namespace {

using schedcast::testing::kBaseUtcMs;
using schedcast::testing::MakeEvent;
using schedcast::testing::MakeSnapshot;
using schedcast::testing::MakeTrack;

constexpr const char* kReplacementJson = R"([
  {
    "event_id": "live",
    "event_name": "Live Hour",
    "artist_name": "Band",
    "start_time_utc": "2025-01-01T01:00:00Z",
    "end_time_utc": "2025-01-01T02:00:00Z",
    "tracks": [
      {"track_id": "r1", "track_url": "r1.mp3", "track_duration_seconds": 300},
      {"track_id": "r2", "track_url": "r2.mp3"}
    ]
  },
  {
    "event_id": "hollow",
    "start_time_utc": "2025-01-01T03:00:00Z",
    "end_time_utc": "2025-01-01T04:00:00Z",
    "tracks": []
  }
])";

class ScheduledPlayoutServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<schedule::ScheduleStore>();
    bus_ = std::make_shared<playback::PlaybackEventBus>();
    clock_ = std::make_shared<schedcast::testing::DeterministicTimeSource>(kBaseUtcMs);
    service_ = std::make_unique<ScheduledPlayoutImpl>(store_, bus_, clock_);

    grpc::ServerBuilder builder;
    builder.RegisterService(service_.get());
    server_ = builder.BuildAndStart();
    ASSERT_NE(server_, nullptr);
    stub_ = v1::ScheduledPlayout::NewStub(server_->InProcessChannel(grpc::ChannelArguments()));
  }

  void TearDown() override {
    service_->Shutdown();
    if (server_) {
      server_->Shutdown();
    }
  }

  // Event "e" runs 60s..1h and carries two 120s tracks.
  void InstallDefaultSchedule() {
    store_->Replace(MakeSnapshot({MakeEvent(
        "e", 60'000, 3'600'000, {MakeTrack("t0", 120.0), MakeTrack("t1", 120.0)})}));
  }

  std::shared_ptr<schedule::ScheduleStore> store_;
  std::shared_ptr<playback::PlaybackEventBus> bus_;
  std::shared_ptr<schedcast::testing::DeterministicTimeSource> clock_;
  std::unique_ptr<ScheduledPlayoutImpl> service_;
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<v1::ScheduledPlayout::Stub> stub_;
};

TEST_F(ScheduledPlayoutServiceTest, ReportsApiVersion) {
  grpc::ClientContext ctx;
  v1::ApiVersion version;
  ASSERT_TRUE(stub_->GetVersion(&ctx, v1::ApiVersionRequest(), &version).ok());
  EXPECT_EQ(version.version(), "1.0.0");
}

TEST_F(ScheduledPlayoutServiceTest, StatusWithoutLoopIsIdle) {
  InstallDefaultSchedule();

  grpc::ClientContext ctx;
  v1::PlaybackStatus status;
  ASSERT_TRUE(stub_->GetStatus(&ctx, v1::GetStatusRequest(), &status).ok());
  EXPECT_EQ(status.state(), "idle");
  EXPECT_FALSE(status.running());
  EXPECT_FALSE(status.has_active_event());
  EXPECT_FALSE(status.has_current_track());
  EXPECT_EQ(status.now_utc(), schedule::FormatUtcTimestampMs(kBaseUtcMs));
  EXPECT_EQ(status.schedule_version(), 1u);
  EXPECT_FALSE(status.time_synced());
}

TEST_F(ScheduledPlayoutServiceTest, QueryLocatesTrackInsideActiveEvent) {
  InstallDefaultSchedule();

  v1::QueryEventAtRequest request;
  // 190s into the event: 70s into the second track.
  request.set_at_utc(schedule::FormatUtcTimestampMs(kBaseUtcMs + 60'000 + 190'000));
  grpc::ClientContext ctx;
  v1::QueryEventAtResponse response;
  ASSERT_TRUE(stub_->QueryEventAt(&ctx, request, &response).ok());

  EXPECT_EQ(response.kind(), "active");
  EXPECT_EQ(response.event().event_id(), "e");
  EXPECT_EQ(response.event().track_count(), 2);
  EXPECT_EQ(response.elapsed_ms(), 190'000);
  EXPECT_EQ(response.track_index(), 1);
  EXPECT_DOUBLE_EQ(response.track_offset_seconds(), 70.0);
  // Two 120s tracks cut the window at start + 240s.
  EXPECT_EQ(response.effective_end_utc(),
            schedule::FormatUtcTimestampMs(kBaseUtcMs + 60'000 + 240'000));
}

TEST_F(ScheduledPlayoutServiceTest, EmptyQueryUsesServiceClock) {
  InstallDefaultSchedule();

  grpc::ClientContext ctx;
  v1::QueryEventAtResponse response;
  ASSERT_TRUE(stub_->QueryEventAt(&ctx, v1::QueryEventAtRequest(), &response).ok());
  EXPECT_EQ(response.kind(), "upcoming");
  EXPECT_EQ(response.event().event_id(), "e");
  EXPECT_EQ(response.wait_ms(), 60'000);
  EXPECT_EQ(response.track_index(), -1);
}

TEST_F(ScheduledPlayoutServiceTest, QueryPastEveryEventFindsNothing) {
  InstallDefaultSchedule();

  v1::QueryEventAtRequest request;
  request.set_at_utc(schedule::FormatUtcTimestampMs(kBaseUtcMs + 10'000'000));
  grpc::ClientContext ctx;
  v1::QueryEventAtResponse response;
  ASSERT_TRUE(stub_->QueryEventAt(&ctx, request, &response).ok());
  EXPECT_EQ(response.kind(), "none");
  EXPECT_FALSE(response.has_event());
  EXPECT_EQ(response.track_index(), -1);
}

TEST_F(ScheduledPlayoutServiceTest, QueryRejectsBadTimestamp) {
  v1::QueryEventAtRequest request;
  request.set_at_utc("yesterday at noon");
  grpc::ClientContext ctx;
  v1::QueryEventAtResponse response;
  const auto status = stub_->QueryEventAt(&ctx, request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_NE(status.error_message().find("yesterday at noon"), std::string::npos);
}

TEST_F(ScheduledPlayoutServiceTest, ReplaceInstallsAndReportsIssues) {
  v1::ReplaceScheduleRequest request;
  request.set_schedule_json(kReplacementJson);
  grpc::ClientContext ctx;
  v1::ReplaceScheduleResponse response;
  ASSERT_TRUE(stub_->ReplaceSchedule(&ctx, request, &response).ok());

  EXPECT_TRUE(response.success());
  EXPECT_EQ(response.version(), 1u);
  EXPECT_EQ(response.event_count(), 2);
  EXPECT_EQ(response.valid_event_count(), 1);
  ASSERT_EQ(response.issues_size(), 2);

  // "live" keeps playing with a partial track list; "hollow" is dropped.
  EXPECT_EQ(response.issues(0).event_id(), "live");
  EXPECT_EQ(response.issues(0).error(), "MISSING_TRACK_DURATION");
  EXPECT_FALSE(response.issues(0).excluded());
  EXPECT_EQ(response.issues(1).event_id(), "hollow");
  EXPECT_EQ(response.issues(1).error(), "EMPTY_TRACK_LIST");
  EXPECT_TRUE(response.issues(1).excluded());

  EXPECT_EQ(store_->version(), 1u);
  ASSERT_NE(store_->Get().schedule, nullptr);
  EXPECT_EQ(store_->Get().schedule->events.size(), 2u);
}

TEST_F(ScheduledPlayoutServiceTest, ReplaceRejectsMalformedJson) {
  InstallDefaultSchedule();

  v1::ReplaceScheduleRequest request;
  request.set_schedule_json("[{\"event_id\": ");
  grpc::ClientContext ctx;
  v1::ReplaceScheduleResponse response;
  const auto status = stub_->ReplaceSchedule(&ctx, request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(status.error_message().rfind("MALFORMED_JSON: ", 0), 0u);
  // The installed schedule is untouched.
  EXPECT_EQ(store_->version(), 1u);
}

TEST_F(ScheduledPlayoutServiceTest, ExportBeforeAnyScheduleIsEmptyArray) {
  grpc::ClientContext ctx;
  v1::ExportScheduleResponse response;
  ASSERT_TRUE(stub_->ExportSchedule(&ctx, v1::ExportScheduleRequest(), &response).ok());
  EXPECT_EQ(response.schedule_json(), "[]");
  EXPECT_EQ(response.version(), 0u);
}

TEST_F(ScheduledPlayoutServiceTest, ExportReturnsReplacedSchedule) {
  {
    v1::ReplaceScheduleRequest request;
    request.set_schedule_json(kReplacementJson);
    grpc::ClientContext ctx;
    v1::ReplaceScheduleResponse response;
    ASSERT_TRUE(stub_->ReplaceSchedule(&ctx, request, &response).ok());
  }

  grpc::ClientContext ctx;
  v1::ExportScheduleResponse response;
  ASSERT_TRUE(stub_->ExportSchedule(&ctx, v1::ExportScheduleRequest(), &response).ok());
  EXPECT_EQ(response.version(), 1u);
  EXPECT_NE(response.schedule_json().find("\"live\""), std::string::npos);
  EXPECT_NE(response.schedule_json().find("\"hollow\""), std::string::npos);
  EXPECT_NE(response.schedule_json().find("r2.mp3"), std::string::npos);
}

TEST_F(ScheduledPlayoutServiceTest, StreamsPlaybackNotificationsInOrder) {
  auto schedule = MakeSnapshot(
      {MakeEvent("e", 0, 600'000, {MakeTrack("t0", 120.0)}, "Evening")});
  const schedule::EventPtr event = schedule->events[0];
  const playback::TrackPtr track(event, &event->tracks[0]);

  grpc::ClientContext ctx;
  auto reader = stub_->SubscribePlaybackEvents(&ctx, v1::SubscribePlaybackEventsRequest());

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (bus_->subscriber_count() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_EQ(bus_->subscriber_count(), 1u);

  bus_->PublishActiveEventChanged(event, false);
  bus_->PublishTrackChanged(track);
  bus_->PublishTrackChanged(nullptr);

  v1::PlaybackEvent first;
  ASSERT_TRUE(reader->Read(&first));
  ASSERT_TRUE(first.has_active_event_changed());
  EXPECT_TRUE(first.active_event_changed().has_event());
  EXPECT_FALSE(first.active_event_changed().is_fallback());
  EXPECT_EQ(first.active_event_changed().event().event_name(), "Evening");

  v1::PlaybackEvent second;
  ASSERT_TRUE(reader->Read(&second));
  ASSERT_TRUE(second.has_track_changed());
  EXPECT_TRUE(second.track_changed().has_track());
  EXPECT_EQ(second.track_changed().track().track_id(), "t0");
  EXPECT_EQ(second.track_changed().track().track_legacy_id(), "legacy-t0");
  EXPECT_DOUBLE_EQ(second.track_changed().track().duration_seconds(), 120.0);
  EXPECT_GT(second.sequence(), first.sequence());

  v1::PlaybackEvent third;
  ASSERT_TRUE(reader->Read(&third));
  ASSERT_TRUE(third.has_track_changed());
  EXPECT_FALSE(third.track_changed().has_track());
  EXPECT_GT(third.sequence(), second.sequence());

  ctx.TryCancel();
  v1::PlaybackEvent drained;
  while (reader->Read(&drained)) {
  }
  reader->Finish();

  // The listener detaches once the stream observes the cancellation.
  const auto detach_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (bus_->subscriber_count() != 0 &&
         std::chrono::steady_clock::now() < detach_deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_EQ(bus_->subscriber_count(), 0u);
}

TEST_F(ScheduledPlayoutServiceTest, ShutdownEndsOpenStreams) {
  grpc::ClientContext ctx;
  auto reader = stub_->SubscribePlaybackEvents(&ctx, v1::SubscribePlaybackEventsRequest());

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (bus_->subscriber_count() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_EQ(bus_->subscriber_count(), 1u);

  service_->Shutdown();

  v1::PlaybackEvent ignored;
  EXPECT_FALSE(reader->Read(&ignored));
  EXPECT_TRUE(reader->Finish().ok());
  EXPECT_EQ(bus_->subscriber_count(), 0u);
}

}  // namespace
}  // namespace schedcast::air
