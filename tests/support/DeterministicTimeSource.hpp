// Repository: Schedcast-air
// Component: Deterministic Time Source (test only)
// Purpose: Virtual UTC clock moved only by tests and deterministic waiters.
// Copyright (c) 2025 Schedcast

#pragma once

#include <atomic>
#include <cstdint>

#include "schedcast/time/ITimeSource.hpp"

namespace schedcast::testing {

// Virtual UTC clock. Only moves when a test (or a deterministic waiter) moves it.
class DeterministicTimeSource : public time::ITimeSource {
public:
  explicit DeterministicTimeSource(int64_t start_ms = 0) : now_ms_(start_ms) {}

  int64_t NowUtcMs() const override {
    return now_ms_.load(std::memory_order_acquire);
  }

  void AdvanceMs(int64_t delta) {
    now_ms_.fetch_add(delta, std::memory_order_acq_rel);
  }

  void SetMs(int64_t value) {
    now_ms_.store(value, std::memory_order_release);
  }

private:
  std::atomic<int64_t> now_ms_;
};

}  // namespace schedcast::testing
