// Repository: Schedcast-air
// Component: Wait Strategy
// Purpose: Condition-variable wait that Stop() can interrupt immediately.
// Copyright (c) 2025 Schedcast

#include "schedcast/timing/IWaitStrategy.hpp"

#include <chrono>

namespace schedcast::timing {

bool RealtimeWaitStrategy::WaitForMs(int64_t duration_ms) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (cancelled_) return false;
  if (duration_ms <= 0) return true;

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(duration_ms);
  cv_.wait_until(lock, deadline, [this] { return cancelled_; });
  return !cancelled_;
}

void RealtimeWaitStrategy::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

void RealtimeWaitStrategy::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_ = false;
}

bool RealtimeWaitStrategy::IsCancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

}  // namespace schedcast::timing
