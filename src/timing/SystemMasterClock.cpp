// Repository: Schedcast-air
// Component: Master Clock
// Purpose: System implementation over std::chrono system_clock and steady_clock.
// Copyright (c) 2025 Schedcast

#include "schedcast/timing/MasterClock.h"

#include <chrono>

namespace schedcast::timing {

class SystemMasterClock : public MasterClock {
 public:
  SystemMasterClock() : monotonic_origin_(std::chrono::steady_clock::now()) {}

  int64_t now_utc_ms() const override {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               now.time_since_epoch())
        .count();
  }

  int64_t now_monotonic_ms() const override {
    const auto delta = std::chrono::steady_clock::now() - monotonic_origin_;
    return std::chrono::duration_cast<std::chrono::milliseconds>(delta).count();
  }

 private:
  std::chrono::steady_clock::time_point monotonic_origin_;
};

std::shared_ptr<MasterClock> MakeSystemMasterClock() {
  return std::make_shared<SystemMasterClock>();
}

}  // namespace schedcast::timing
