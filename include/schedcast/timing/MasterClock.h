// Repository: Schedcast-air
// Component: Master Clock
// Purpose: Local wall-clock and monotonic readings used to anchor synchronized UTC.
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_TIMING_MASTER_CLOCK_H_
#define SCHEDCAST_TIMING_MASTER_CLOCK_H_

#include <cstdint>
#include <memory>

namespace schedcast::timing {

// MasterClock provides the two local readings UtcTimeSync combines:
// the host wall clock (may jump when NTP steps it) and a monotonic counter
// (never jumps, arbitrary origin).
class MasterClock {
 public:
  virtual ~MasterClock() = default;

  // Returns current local UTC time in milliseconds since Unix epoch.
  virtual int64_t now_utc_ms() const = 0;

  // Returns monotonic time in milliseconds relative to clock construction.
  virtual int64_t now_monotonic_ms() const = 0;

  // Returns true if this is a fake/test clock.
  virtual bool is_fake() const { return false; }
};

std::shared_ptr<MasterClock> MakeSystemMasterClock();

}  // namespace schedcast::timing

#endif  // SCHEDCAST_TIMING_MASTER_CLOCK_H_
