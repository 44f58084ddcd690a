// Repository: Schedcast-air
// Component: Schedule Store
// Purpose: Holds the current immutable schedule snapshot; swaps it atomically
// Copyright (c) 2025 Schedcast

#include "schedcast/schedule/ScheduleStore.hpp"

#include <sstream>

#include "schedcast/util/Logger.hpp"

namespace schedcast::schedule {

ScheduleStore::ScheduleStore(SchedulePtr initial) {
  if (initial) {
    schedule_ = std::move(initial);
    version_ = 1;
  }
}

uint64_t ScheduleStore::Replace(SchedulePtr schedule) {
  size_t count = schedule ? schedule->events.size() : 0;
  uint64_t version = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    schedule_ = std::move(schedule);
    version = ++version_;
  }
  std::ostringstream oss;
  oss << "[ScheduleStore] Installed schedule v" << version << " (" << count << " events)";
  util::Logger::Info(oss.str());
  return version;
}

ScheduleStore::Snapshot ScheduleStore::Get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {schedule_, version_};
}

uint64_t ScheduleStore::version() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return version_;
}

}  // namespace schedcast::schedule
