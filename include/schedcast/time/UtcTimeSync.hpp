// Repository: Schedcast-air
// Component: UTC Time Sync
// Purpose: Monotonic-extrapolated UTC anchored to a periodically refreshed reference
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_TIME_UTC_TIME_SYNC_HPP_
#define SCHEDCAST_TIME_UTC_TIME_SYNC_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "schedcast/time/ITimeSource.hpp"
#include "schedcast/time/IUtcReferenceSource.hpp"
#include "schedcast/timing/IWaitStrategy.hpp"
#include "schedcast/timing/MasterClock.h"

namespace schedcast::time {

struct UtcTimeSyncConfig {
  // Period between reference refreshes after initialization. <= 0 disables resync.
  int64_t resync_interval_ms = 60'000;

  // When non-empty and parseable, the anchor is pinned here and the
  // reference is never contacted. Unparseable values log a warning and
  // fall back to the reference.
  std::string mock_utc_iso;
};

enum class AnchorOrigin {
  kReference,      // Fetched from the external source
  kLocalFallback,  // Reference unavailable at initialization; local wall clock
  kOverride,       // OverrideCurrentTime / mock configuration
};

const char* AnchorOriginToString(AnchorOrigin origin);

// now = base_utc_ms + (monotonic_now - base_monotonic_ms)
struct TimeAnchor {
  int64_t base_utc_ms = 0;
  int64_t base_monotonic_ms = 0;
  AnchorOrigin origin = AnchorOrigin::kLocalFallback;
};

// =============================================================================
// UtcTimeSync
//
// Initialization makes exactly one bounded attempt against the reference.
// On failure it anchors to the local wall clock so initialization always
// completes. Afterwards a background thread refreshes on a fixed interval;
// a failed refresh keeps the previous anchor running on the monotonic clock,
// preserving the last correction obtained.
//
// Between refreshes NowUtcMs() never touches the network.
// =============================================================================

class UtcTimeSync : public ITimeSource {
 public:
  using AnchorListener = std::function<void(const TimeAnchor&)>;

  // reference may be null: the service then anchors to the local clock once
  // and never resyncs. waiter defaults to RealtimeWaitStrategy.
  UtcTimeSync(std::shared_ptr<timing::MasterClock> clock,
              std::shared_ptr<IUtcReferenceSource> reference,
              UtcTimeSyncConfig config = {},
              std::unique_ptr<timing::IWaitStrategy> waiter = nullptr);
  ~UtcTimeSync() override;

  UtcTimeSync(const UtcTimeSync&) = delete;
  UtcTimeSync& operator=(const UtcTimeSync&) = delete;

  // Starts the initialize-then-resync thread. Idempotent.
  void Start();

  // Cancels the pending resync wait and joins. The anchor is kept.
  void Stop();

  // Starts the lifecycle if needed, then blocks until an anchor exists.
  void EnsureInitialized() override;

  // Never blocks. Local wall clock until the first anchor exists.
  int64_t NowUtcMs() const override;

  // Pins the anchor to utc_ms (mock mode). Stops further refreshes.
  void OverrideCurrentTime(int64_t utc_ms);

  bool IsReady() const;
  bool IsMockTime() const;
  std::optional<TimeAnchor> anchor() const;

  // Listeners fire after every anchor update, outside the internal lock.
  uint64_t AddAnchorListener(AnchorListener listener);
  void RemoveAnchorListener(uint64_t id);

  // Single initialization step (no-op once initialized). Used by the
  // lifecycle thread; callable directly for deterministic tests.
  void InitializeNow();

  // Single refresh against the reference. Returns true if the anchor moved.
  bool RefreshNow();

 private:
  void LifecycleLoop();
  void SetAnchor(int64_t utc_ms, AnchorOrigin origin);
  // Reference and local-fallback readings; dropped once mock mode is on.
  bool SetAnchorUnlessOverridden(int64_t utc_ms, AnchorOrigin origin);
  bool CommitAnchor(int64_t utc_ms, AnchorOrigin origin, bool yield_to_override);

  std::shared_ptr<timing::MasterClock> clock_;
  std::shared_ptr<IUtcReferenceSource> reference_;
  UtcTimeSyncConfig config_;
  std::unique_ptr<timing::IWaitStrategy> waiter_;

  mutable std::mutex mutex_;
  std::condition_variable initialized_cv_;
  std::optional<TimeAnchor> anchor_;
  bool mock_ = false;

  std::mutex listener_mutex_;
  std::vector<std::pair<uint64_t, AnchorListener>> listeners_;
  uint64_t next_listener_id_ = 1;

  std::mutex lifecycle_mutex_;
  std::thread lifecycle_thread_;
  std::atomic<bool> running_{false};
};

}  // namespace schedcast::time

#endif  // SCHEDCAST_TIME_UTC_TIME_SYNC_HPP_
