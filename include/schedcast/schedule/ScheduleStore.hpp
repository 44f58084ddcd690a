// Repository: Schedcast-air
// Component: Schedule Store
// Purpose: Holds the current immutable schedule snapshot; swaps it atomically
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_SCHEDULE_STORE_HPP_
#define SCHEDCAST_SCHEDULE_STORE_HPP_

#include <cstdint>
#include <mutex>

#include "schedcast/schedule/ScheduleTypes.hpp"

namespace schedcast::schedule {

// Readers take one snapshot per resolve cycle and keep using it for that
// cycle even if Replace() runs concurrently; the next cycle sees the new one.
class ScheduleStore {
 public:
  struct Snapshot {
    SchedulePtr schedule;
    uint64_t version = 0;  // 0 = never populated
  };

  ScheduleStore() = default;
  explicit ScheduleStore(SchedulePtr initial);

  // Installs a new snapshot. Returns the new version number.
  uint64_t Replace(SchedulePtr schedule);

  Snapshot Get() const;

  uint64_t version() const;

 private:
  mutable std::mutex mutex_;
  SchedulePtr schedule_;
  uint64_t version_ = 0;
};

}  // namespace schedcast::schedule

#endif  // SCHEDCAST_SCHEDULE_STORE_HPP_
