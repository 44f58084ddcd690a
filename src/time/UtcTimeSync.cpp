// Repository: Schedcast-air
// Component: UTC Time Sync
// Purpose: Monotonic-extrapolated UTC anchored to a periodically refreshed reference
// Copyright (c) 2025 Schedcast

#include "schedcast/time/UtcTimeSync.hpp"

#include <algorithm>
#include <sstream>

#include "schedcast/schedule/Timestamp.hpp"
#include "schedcast/util/Logger.hpp"

namespace schedcast::time {

using util::Logger;

const char* AnchorOriginToString(AnchorOrigin origin) {
  switch (origin) {
    case AnchorOrigin::kReference:
      return "reference";
    case AnchorOrigin::kLocalFallback:
      return "local_fallback";
    case AnchorOrigin::kOverride:
      return "override";
  }
  return "unknown";
}

UtcTimeSync::UtcTimeSync(std::shared_ptr<timing::MasterClock> clock,
                         std::shared_ptr<IUtcReferenceSource> reference,
                         UtcTimeSyncConfig config,
                         std::unique_ptr<timing::IWaitStrategy> waiter)
    : clock_(std::move(clock)),
      reference_(std::move(reference)),
      config_(std::move(config)),
      waiter_(waiter ? std::move(waiter) : std::make_unique<timing::RealtimeWaitStrategy>()) {}

UtcTimeSync::~UtcTimeSync() {
  Stop();
}

void UtcTimeSync::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return;
  }
  if (lifecycle_thread_.joinable()) {
    lifecycle_thread_.join();
  }
  waiter_->Reset();
  running_.store(true, std::memory_order_release);
  lifecycle_thread_ = std::thread(&UtcTimeSync::LifecycleLoop, this);
}

void UtcTimeSync::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  waiter_->Cancel();
  if (lifecycle_thread_.joinable()) {
    lifecycle_thread_.join();
  }
  running_.store(false, std::memory_order_release);
}

void UtcTimeSync::EnsureInitialized() {
  if (IsReady()) return;
  Start();
  std::unique_lock<std::mutex> lock(mutex_);
  initialized_cv_.wait(lock, [this] { return anchor_.has_value(); });
}

int64_t UtcTimeSync::NowUtcMs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!anchor_) {
    return clock_->now_utc_ms();
  }
  const int64_t elapsed =
      std::max<int64_t>(0, clock_->now_monotonic_ms() - anchor_->base_monotonic_ms);
  return anchor_->base_utc_ms + elapsed;
}

void UtcTimeSync::OverrideCurrentTime(int64_t utc_ms) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    mock_ = true;
  }
  Logger::Info("[UtcTimeSync] Time overridden to " + schedule::FormatUtcTimestampMs(utc_ms));
  SetAnchor(utc_ms, AnchorOrigin::kOverride);
  // Wake the resync loop so it observes mock mode and exits.
  waiter_->Cancel();
}

bool UtcTimeSync::IsReady() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return anchor_.has_value();
}

bool UtcTimeSync::IsMockTime() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mock_;
}

std::optional<TimeAnchor> UtcTimeSync::anchor() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return anchor_;
}

uint64_t UtcTimeSync::AddAnchorListener(AnchorListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const uint64_t id = next_listener_id_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void UtcTimeSync::RemoveAnchorListener(uint64_t id) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [id](const auto& entry) { return entry.first == id; }),
                   listeners_.end());
}

void UtcTimeSync::SetAnchor(int64_t utc_ms, AnchorOrigin origin) {
  CommitAnchor(utc_ms, origin, false);
}

bool UtcTimeSync::SetAnchorUnlessOverridden(int64_t utc_ms, AnchorOrigin origin) {
  return CommitAnchor(utc_ms, origin, true);
}

// The mock check and the write share one critical section, so an override
// that lands while a fetch is in flight always wins.
bool UtcTimeSync::CommitAnchor(int64_t utc_ms, AnchorOrigin origin, bool yield_to_override) {
  TimeAnchor anchor;
  anchor.base_utc_ms = utc_ms;
  anchor.base_monotonic_ms = clock_->now_monotonic_ms();
  anchor.origin = origin;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (yield_to_override && mock_) {
      return false;
    }
    anchor_ = anchor;
  }
  initialized_cv_.notify_all();

  std::vector<AnchorListener> listeners;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    for (const auto& entry : listeners_) listeners.push_back(entry.second);
  }
  for (const auto& listener : listeners) {
    listener(anchor);
  }
  return true;
}

void UtcTimeSync::InitializeNow() {
  if (IsReady()) return;

  if (!config_.mock_utc_iso.empty()) {
    auto mock = schedule::ParseUtcTimestampMs(config_.mock_utc_iso);
    if (mock) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        mock_ = true;
      }
      Logger::Info("[UtcTimeSync] Using mock UTC time " + config_.mock_utc_iso);
      SetAnchor(*mock, AnchorOrigin::kOverride);
      return;
    }
    Logger::Warn("[UtcTimeSync] Mock UTC time \"" + config_.mock_utc_iso +
                 "\" is invalid. Falling back to reference source.");
  }

  if (!reference_) {
    Logger::Warn("[UtcTimeSync] No reference source configured. Using local UTC time.");
    SetAnchorUnlessOverridden(clock_->now_utc_ms(), AnchorOrigin::kLocalFallback);
    return;
  }

  Logger::Info("[UtcTimeSync] Fetching UTC time from " + reference_->Describe() + "...");
  auto fetched = reference_->FetchUtcMs();
  if (fetched) {
    if (!SetAnchorUnlessOverridden(*fetched, AnchorOrigin::kReference)) {
      Logger::Info("[UtcTimeSync] Time was overridden during fetch; discarding reference reading.");
      return;
    }
    std::ostringstream oss;
    oss << "[UtcTimeSync] Initialized from reference: " << schedule::FormatUtcTimestampMs(*fetched)
        << " (local skew " << (*fetched - clock_->now_utc_ms()) << "ms)";
    Logger::Info(oss.str());
    return;
  }

  if (SetAnchorUnlessOverridden(clock_->now_utc_ms(), AnchorOrigin::kLocalFallback)) {
    Logger::Warn("[UtcTimeSync] Falling back to local UTC time for initialization.");
  }
}

bool UtcTimeSync::RefreshNow() {
  if (IsMockTime() || !reference_) {
    return false;
  }
  auto fetched = reference_->FetchUtcMs();
  if (!fetched) {
    Logger::Warn("[UtcTimeSync] Refresh from " + reference_->Describe() +
                 " failed; keeping previous anchor.");
    return false;
  }
  if (!SetAnchorUnlessOverridden(*fetched, AnchorOrigin::kReference)) {
    Logger::Debug("[UtcTimeSync] Time was overridden during refresh; reading discarded.");
    return false;
  }
  Logger::Debug("[UtcTimeSync] Resynced to " + schedule::FormatUtcTimestampMs(*fetched));
  return true;
}

void UtcTimeSync::LifecycleLoop() {
  InitializeNow();

  while (running_.load(std::memory_order_acquire)) {
    if (IsMockTime() || !reference_ || config_.resync_interval_ms <= 0) {
      break;
    }
    if (!waiter_->WaitForMs(config_.resync_interval_ms)) {
      break;
    }
    RefreshNow();
  }
  running_.store(false, std::memory_order_release);
}

}  // namespace schedcast::time
