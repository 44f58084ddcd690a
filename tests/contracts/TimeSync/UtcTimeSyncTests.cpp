// Repository: Schedcast-air
// Component: UTC Time Sync Contract Tests
// Purpose: Anchor initialization, fallback, refresh and mock-time behavior.
// Copyright (c) 2025 Schedcast

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "../../fixtures/MasterClockStub.h"
#include "../../fixtures/UtcReferenceStub.h"
#include "schedcast/schedule/Timestamp.hpp"
#include "schedcast/time/UtcTimeSync.hpp"

namespace schedcast::time {
namespace {

using tests::fixtures::FakeMasterClock;
using tests::fixtures::FakeUtcReferenceSource;

constexpr int64_t kLocalUtc = 1'700'000'000'000;
constexpr int64_t kReferenceUtc = 1'735'689'600'000;  // 2025-01-01T00:00:00Z

class UtcTimeSyncTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<FakeMasterClock>(kLocalUtc, 50'000);
    reference_ = std::make_shared<FakeUtcReferenceSource>();
  }

  // Resync disabled: tests drive RefreshNow() directly.
  std::unique_ptr<UtcTimeSync> MakeSync(UtcTimeSyncConfig config = {}) {
    config.resync_interval_ms = 0;
    return std::make_unique<UtcTimeSync>(clock_, reference_, config);
  }

  std::shared_ptr<FakeMasterClock> clock_;
  std::shared_ptr<FakeUtcReferenceSource> reference_;
};

TEST_F(UtcTimeSyncTest, UsesLocalClockBeforeInitialization) {
  auto sync = MakeSync();
  EXPECT_FALSE(sync->IsReady());
  EXPECT_EQ(sync->NowUtcMs(), kLocalUtc);
}

TEST_F(UtcTimeSyncTest, AnchorsToReferenceAndExtrapolatesMonotonically) {
  reference_->Enqueue(kReferenceUtc);
  auto sync = MakeSync();
  sync->InitializeNow();

  ASSERT_TRUE(sync->IsReady());
  EXPECT_EQ(sync->anchor()->origin, AnchorOrigin::kReference);
  EXPECT_EQ(sync->NowUtcMs(), kReferenceUtc);

  clock_->Advance(1'500);
  EXPECT_EQ(sync->NowUtcMs(), kReferenceUtc + 1'500);

  // A wall-clock step on the host does not move synchronized time.
  clock_->StepWallClock(-3'600'000);
  EXPECT_EQ(sync->NowUtcMs(), kReferenceUtc + 1'500);
  EXPECT_EQ(reference_->calls(), 1);
}

TEST_F(UtcTimeSyncTest, FallsBackToLocalClockWhenReferenceFails) {
  reference_->Enqueue(std::nullopt);
  auto sync = MakeSync();
  sync->InitializeNow();

  ASSERT_TRUE(sync->IsReady());
  EXPECT_EQ(sync->anchor()->origin, AnchorOrigin::kLocalFallback);
  EXPECT_EQ(sync->NowUtcMs(), kLocalUtc);
}

TEST_F(UtcTimeSyncTest, NoReferenceAnchorsLocally) {
  auto sync = std::make_unique<UtcTimeSync>(clock_, nullptr, UtcTimeSyncConfig{0, ""});
  sync->EnsureInitialized();
  ASSERT_TRUE(sync->IsReady());
  EXPECT_EQ(sync->anchor()->origin, AnchorOrigin::kLocalFallback);
  EXPECT_FALSE(sync->RefreshNow());
}

TEST_F(UtcTimeSyncTest, FailedRefreshKeepsPreviousAnchor) {
  reference_->Enqueue(kReferenceUtc);
  reference_->Enqueue(std::nullopt);
  auto sync = MakeSync();
  sync->InitializeNow();

  clock_->Advance(10'000);
  EXPECT_FALSE(sync->RefreshNow());
  EXPECT_EQ(sync->anchor()->base_utc_ms, kReferenceUtc);
  EXPECT_EQ(sync->NowUtcMs(), kReferenceUtc + 10'000);
}

TEST_F(UtcTimeSyncTest, SuccessfulRefreshMovesAnchor) {
  reference_->Enqueue(kReferenceUtc);
  reference_->Enqueue(kReferenceUtc + 20'000);
  auto sync = MakeSync();
  sync->InitializeNow();

  clock_->Advance(10'000);
  EXPECT_TRUE(sync->RefreshNow());
  EXPECT_EQ(sync->NowUtcMs(), kReferenceUtc + 20'000);
  EXPECT_EQ(sync->anchor()->base_monotonic_ms, clock_->now_monotonic_ms());
}

TEST_F(UtcTimeSyncTest, MockTimeNeverContactsReference) {
  UtcTimeSyncConfig config;
  config.mock_utc_iso = "2025-06-01T12:00:00Z";
  auto sync = MakeSync(config);
  sync->EnsureInitialized();

  EXPECT_TRUE(sync->IsMockTime());
  EXPECT_EQ(sync->anchor()->origin, AnchorOrigin::kOverride);
  EXPECT_EQ(sync->NowUtcMs(), *schedule::ParseUtcTimestampMs("2025-06-01T12:00:00Z"));
  EXPECT_FALSE(sync->RefreshNow());
  EXPECT_EQ(reference_->calls(), 0);
}

TEST_F(UtcTimeSyncTest, OverrideDuringInitialFetchWins) {
  auto sync = MakeSync();
  reference_->Enqueue(kReferenceUtc);
  reference_->SetFetchHook([&sync] { sync->OverrideCurrentTime(1'000'000); });

  sync->InitializeNow();

  EXPECT_TRUE(sync->IsMockTime());
  EXPECT_EQ(sync->anchor()->origin, AnchorOrigin::kOverride);
  EXPECT_EQ(sync->NowUtcMs(), 1'000'000);
}

TEST_F(UtcTimeSyncTest, OverrideDuringRefreshWins) {
  reference_->Enqueue(kReferenceUtc);
  reference_->Enqueue(kReferenceUtc + 60'000);
  auto sync = MakeSync();
  sync->InitializeNow();
  ASSERT_EQ(sync->anchor()->origin, AnchorOrigin::kReference);

  std::vector<AnchorOrigin> announced;
  sync->AddAnchorListener([&announced](const TimeAnchor& a) { announced.push_back(a.origin); });
  reference_->SetFetchHook([&sync] { sync->OverrideCurrentTime(2'000'000); });

  EXPECT_FALSE(sync->RefreshNow());
  EXPECT_TRUE(sync->IsMockTime());
  EXPECT_EQ(sync->anchor()->origin, AnchorOrigin::kOverride);
  EXPECT_EQ(sync->NowUtcMs(), 2'000'000);
  // Only the override was announced; the discarded reading never was.
  EXPECT_EQ(announced, std::vector<AnchorOrigin>{AnchorOrigin::kOverride});
}

TEST_F(UtcTimeSyncTest, InvalidMockFallsBackToReference) {
  reference_->Enqueue(kReferenceUtc);
  UtcTimeSyncConfig config;
  config.mock_utc_iso = "not-a-time";
  auto sync = MakeSync(config);
  sync->InitializeNow();

  EXPECT_FALSE(sync->IsMockTime());
  EXPECT_EQ(sync->NowUtcMs(), kReferenceUtc);
}

TEST_F(UtcTimeSyncTest, OverrideCurrentTimeSwitchesToMockMode) {
  reference_->Enqueue(kReferenceUtc);
  auto sync = MakeSync();
  sync->InitializeNow();

  sync->OverrideCurrentTime(42'000);
  EXPECT_TRUE(sync->IsMockTime());
  EXPECT_EQ(sync->NowUtcMs(), 42'000);
  clock_->Advance(1'000);
  EXPECT_EQ(sync->NowUtcMs(), 43'000);
  EXPECT_FALSE(sync->RefreshNow());
}

TEST_F(UtcTimeSyncTest, ListenersObserveEveryAnchorUpdate) {
  reference_->Enqueue(kReferenceUtc);
  reference_->Enqueue(kReferenceUtc + 5);
  auto sync = MakeSync();

  std::vector<AnchorOrigin> seen;
  uint64_t id = sync->AddAnchorListener([&](const TimeAnchor& a) { seen.push_back(a.origin); });
  sync->InitializeNow();
  sync->RefreshNow();
  sync->RemoveAnchorListener(id);
  sync->OverrideCurrentTime(1);

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], AnchorOrigin::kReference);
  EXPECT_EQ(seen[1], AnchorOrigin::kReference);
}

TEST_F(UtcTimeSyncTest, BackgroundLoopResyncsUntilStopped) {
  for (int i = 0; i < 100; ++i) reference_->Enqueue(kReferenceUtc + i);
  UtcTimeSyncConfig config;
  config.resync_interval_ms = 5;
  auto sync = std::make_unique<UtcTimeSync>(clock_, reference_, config);

  sync->EnsureInitialized();
  EXPECT_TRUE(sync->IsReady());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (reference_->calls() < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  sync->Stop();
  EXPECT_GE(reference_->calls(), 3);

  const int calls_after_stop = reference_->calls();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(reference_->calls(), calls_after_stop);
}

TEST_F(UtcTimeSyncTest, OriginNamesAreStable) {
  EXPECT_STREQ(AnchorOriginToString(AnchorOrigin::kReference), "reference");
  EXPECT_STREQ(AnchorOriginToString(AnchorOrigin::kLocalFallback), "local_fallback");
  EXPECT_STREQ(AnchorOriginToString(AnchorOrigin::kOverride), "override");
}

}  // namespace
}  // namespace schedcast::time
