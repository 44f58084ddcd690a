// Repository: Schedcast-air
// Component: ScheduledPlayout gRPC Service Implementation
// Purpose: Presentation and control surface over the playback loop and schedule store.
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_PLAYOUT_STATUS_SERVICE_H_
#define SCHEDCAST_PLAYOUT_STATUS_SERVICE_H_

#include <atomic>
#include <cstdint>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "schedcast.grpc.pb.h"
#include "schedcast.pb.h"
#include "schedcast/playback/PlaybackEventBus.hpp"
#include "schedcast/playback/PlaybackLoop.hpp"
#include "schedcast/schedule/ScheduleStore.hpp"
#include "schedcast/time/ITimeSource.hpp"
#include "schedcast/time/UtcTimeSync.hpp"

namespace schedcast {
namespace air {

// ScheduledPlayoutImpl implements the gRPC service defined in schedcast.proto.
// This is a thin adapter: reads go to snapshots, writes go to the store.
class ScheduledPlayoutImpl final : public v1::ScheduledPlayout::Service {
 public:
  // loop and time_sync may be null (inspection-only deployments).
  ScheduledPlayoutImpl(std::shared_ptr<schedule::ScheduleStore> store,
                       std::shared_ptr<playback::PlaybackEventBus> bus,
                       std::shared_ptr<time::ITimeSource> time_source,
                       std::shared_ptr<playback::PlaybackLoop> loop = nullptr,
                       std::shared_ptr<time::UtcTimeSync> time_sync = nullptr);
  ~ScheduledPlayoutImpl() override;

  ScheduledPlayoutImpl(const ScheduledPlayoutImpl&) = delete;
  ScheduledPlayoutImpl& operator=(const ScheduledPlayoutImpl&) = delete;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const v1::ApiVersionRequest* request,
                          v1::ApiVersion* response) override;

  grpc::Status GetStatus(grpc::ServerContext* context,
                         const v1::GetStatusRequest* request,
                         v1::PlaybackStatus* response) override;

  grpc::Status QueryEventAt(grpc::ServerContext* context,
                            const v1::QueryEventAtRequest* request,
                            v1::QueryEventAtResponse* response) override;

  // Server-streaming RPC. Ends when the client cancels or Shutdown() is called.
  grpc::Status SubscribePlaybackEvents(grpc::ServerContext* context,
                                       const v1::SubscribePlaybackEventsRequest* request,
                                       grpc::ServerWriter<v1::PlaybackEvent>* writer) override;

  grpc::Status ReplaceSchedule(grpc::ServerContext* context,
                               const v1::ReplaceScheduleRequest* request,
                               v1::ReplaceScheduleResponse* response) override;

  grpc::Status ExportSchedule(grpc::ServerContext* context,
                              const v1::ExportScheduleRequest* request,
                              v1::ExportScheduleResponse* response) override;

  // Ends open notification streams so grpc::Server::Shutdown can complete.
  void Shutdown();

 private:
  std::shared_ptr<schedule::ScheduleStore> store_;
  std::shared_ptr<playback::PlaybackEventBus> bus_;
  std::shared_ptr<time::ITimeSource> time_source_;
  std::shared_ptr<playback::PlaybackLoop> loop_;
  std::shared_ptr<time::UtcTimeSync> time_sync_;

  std::atomic<bool> shutting_down_{false};
  std::atomic<uint64_t> next_sequence_{1};
};

}  // namespace air
}  // namespace schedcast

#endif  // SCHEDCAST_PLAYOUT_STATUS_SERVICE_H_
