// Repository: Schedcast-air
// Component: Master Clock Stub
// Purpose: Settable wall and monotonic clocks for time-sync tests.
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_TESTS_FIXTURES_MASTER_CLOCK_STUB_H_
#define SCHEDCAST_TESTS_FIXTURES_MASTER_CLOCK_STUB_H_

#include <atomic>
#include <cstdint>

#include "schedcast/timing/MasterClock.h"

namespace schedcast::tests::fixtures
{

class FakeMasterClock : public timing::MasterClock
{
public:
  explicit FakeMasterClock(int64_t utc_ms = 1'700'000'000'000,
                           int64_t monotonic_ms = 10'000)
      : utc_ms_(utc_ms), monotonic_ms_(monotonic_ms)
  {
  }

  int64_t now_utc_ms() const override
  {
    return utc_ms_.load(std::memory_order_acquire);
  }

  int64_t now_monotonic_ms() const override
  {
    return monotonic_ms_.load(std::memory_order_acquire);
  }

  bool is_fake() const override { return true; }

  // Both clocks move together, as on a healthy host.
  void Advance(int64_t delta_ms)
  {
    utc_ms_.fetch_add(delta_ms, std::memory_order_acq_rel);
    monotonic_ms_.fetch_add(delta_ms, std::memory_order_acq_rel);
  }

  // Wall clock jumps (NTP step, user change); monotonic is unaffected.
  void StepWallClock(int64_t delta_ms)
  {
    utc_ms_.fetch_add(delta_ms, std::memory_order_acq_rel);
  }

  void SetMonotonic(int64_t value_ms)
  {
    monotonic_ms_.store(value_ms, std::memory_order_release);
  }

private:
  std::atomic<int64_t> utc_ms_;
  std::atomic<int64_t> monotonic_ms_;
};

} // namespace schedcast::tests::fixtures

#endif // SCHEDCAST_TESTS_FIXTURES_MASTER_CLOCK_STUB_H_
