// Repository: Schedcast-air
// Component: Wait Strategy Interface
// Purpose: Cancellable suspension used by every wait in the playback and resync loops.
//          Production: RealtimeWaitStrategy blocks on a condition variable.
//          Tests: DeterministicWaitStrategy (advances virtual time, no sleep).
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_TIMING_IWAIT_STRATEGY_HPP_
#define SCHEDCAST_TIMING_IWAIT_STRATEGY_HPP_

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace schedcast::timing {

class IWaitStrategy {
 public:
  virtual ~IWaitStrategy() = default;

  // Suspends for duration_ms (<= 0 returns immediately).
  // Returns false if the wait was cut short by Cancel(); callers must unwind.
  virtual bool WaitForMs(int64_t duration_ms) = 0;

  // Wakes any current waiter and makes subsequent waits return false
  // until Reset() is called.
  virtual void Cancel() = 0;

  virtual void Reset() = 0;

  virtual bool IsCancelled() const = 0;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  bool WaitForMs(int64_t duration_ms) override;
  void Cancel() override;
  void Reset() override;
  bool IsCancelled() const override;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_ = false;
};

}  // namespace schedcast::timing

#endif  // SCHEDCAST_TIMING_IWAIT_STRATEGY_HPP_
