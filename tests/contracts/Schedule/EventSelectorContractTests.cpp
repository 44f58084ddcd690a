// Repository: Schedcast-air
// Component: Event Selector Contract Tests
// Purpose: Active/upcoming/none selection over validated windows.
// Copyright (c) 2025 Schedcast

#include <gtest/gtest.h>

#include "../../support/ScheduleBuilders.hpp"
#include "schedcast/schedule/EventSelector.hpp"
#include "schedcast/schedule/ScheduleValidator.hpp"

namespace schedcast::schedule {
namespace {

using testing::kBaseUtcMs;
using testing::MakeEvent;
using testing::MakeSnapshot;
using testing::MakeTrack;

constexpr int64_t T = kBaseUtcMs;

ValidatedSchedule ValidateAll(std::vector<Event> events) {
  return ScheduleValidator().Validate(MakeSnapshot(std::move(events)));
}

// ============================================================================
// Single one-hour event carrying one 180 s track
// ============================================================================

class SingleEventTest : public ::testing::Test {
 protected:
  void SetUp() override {
    schedule_ = ValidateAll({MakeEvent("a", 0, 3'600'000, {MakeTrack("t0", 180.0)})});
    ASSERT_EQ(schedule_.windows.size(), 1u);
  }

  ValidatedSchedule schedule_;
};

TEST_F(SingleEventTest, ActiveAtStart) {
  auto r = EventSelector::Select(schedule_, T);
  ASSERT_TRUE(r.IsActive());
  EXPECT_EQ(r.window->event->id, "a");
  EXPECT_EQ(r.elapsed_ms, 0);
}

TEST_F(SingleEventTest, ActiveMidTrackReportsElapsed) {
  auto r = EventSelector::Select(schedule_, T + 90'000);
  ASSERT_TRUE(r.IsActive());
  EXPECT_EQ(r.elapsed_ms, 90'000);
}

TEST_F(SingleEventTest, NotActivePastTrackAudioEvenBeforeDeclaredEnd) {
  auto r = EventSelector::Select(schedule_, T + 200'000);
  EXPECT_TRUE(r.IsNone());
  EXPECT_FALSE(r.window.has_value());
}

TEST_F(SingleEventTest, EffectiveEndIsExclusive) {
  EXPECT_TRUE(EventSelector::Select(schedule_, T + 179'999).IsActive());
  EXPECT_TRUE(EventSelector::Select(schedule_, T + 180'000).IsNone());
}

TEST_F(SingleEventTest, UpcomingBeforeStart) {
  auto r = EventSelector::Select(schedule_, T - 1);
  ASSERT_TRUE(r.IsUpcoming());
  EXPECT_EQ(r.wait_ms, 1);
}

// ============================================================================
// Multi-event selection
// ============================================================================

TEST(EventSelectorContractTest, SoonestUpcomingWinsWithWait) {
  auto schedule = ValidateAll({
      MakeEvent("b", 10'000, 70'000, {MakeTrack("t", 60.0)}),
      MakeEvent("a", 0, 60'000, {MakeTrack("t", 60.0)}),
  });
  auto r = EventSelector::Select(schedule, T - 5'000);
  ASSERT_TRUE(r.IsUpcoming());
  EXPECT_EQ(r.window->event->id, "a");
  EXPECT_EQ(r.wait_ms, 5'000);
}

TEST(EventSelectorContractTest, UpcomingTieBrokenBySourceOrder) {
  auto schedule = ValidateAll({
      MakeEvent("first", 10'000, 70'000, {MakeTrack("t", 60.0)}),
      MakeEvent("second", 10'000, 70'000, {MakeTrack("t", 60.0)}),
  });
  auto r = EventSelector::Select(schedule, T);
  ASSERT_TRUE(r.IsUpcoming());
  EXPECT_EQ(r.window->event->id, "first");
}

TEST(EventSelectorContractTest, OverlapResolvedByFirstInSourceOrder) {
  auto schedule = ValidateAll({
      MakeEvent("late-start", 30'000, 600'000, {MakeTrack("t", 300.0)}),
      MakeEvent("early-start", 0, 600'000, {MakeTrack("t", 300.0)}),
  });
  auto r = EventSelector::Select(schedule, T + 60'000);
  ASSERT_TRUE(r.IsActive());
  EXPECT_EQ(r.window->event->id, "late-start");
  EXPECT_EQ(r.elapsed_ms, 30'000);

  // Before the first entry starts only the second is active.
  auto early = EventSelector::Select(schedule, T + 10'000);
  ASSERT_TRUE(early.IsActive());
  EXPECT_EQ(early.window->event->id, "early-start");
}

TEST(EventSelectorContractTest, MalformedEntryIgnored) {
  auto mixed = ValidateAll({
      MakeEvent("broken", 60'000, 0, {MakeTrack("t", 60.0)}),
      MakeEvent("good", 0, 60'000, {MakeTrack("t", 60.0)}),
  });
  auto alone = ValidateAll({MakeEvent("good", 0, 60'000, {MakeTrack("t", 60.0)})});

  for (int64_t now : {T - 1'000, T, T + 30'000, T + 60'000}) {
    auto a = EventSelector::Select(mixed, now);
    auto b = EventSelector::Select(alone, now);
    EXPECT_EQ(a.kind, b.kind) << "now offset " << (now - T);
    EXPECT_EQ(a.elapsed_ms, b.elapsed_ms);
    EXPECT_EQ(a.wait_ms, b.wait_ms);
  }
}

TEST(EventSelectorContractTest, EmptyScheduleSelectsNothing) {
  ValidatedSchedule empty;
  EXPECT_TRUE(EventSelector::Select(empty, T).IsNone());
}

TEST(EventSelectorContractTest, ElapsedEventsDoNotBlockLaterOnes) {
  auto schedule = ValidateAll({
      MakeEvent("past", 0, 60'000, {MakeTrack("t", 60.0)}),
      MakeEvent("future", 120'000, 180'000, {MakeTrack("t", 60.0)}),
  });
  auto r = EventSelector::Select(schedule, T + 90'000);
  ASSERT_TRUE(r.IsUpcoming());
  EXPECT_EQ(r.window->event->id, "future");
  EXPECT_EQ(r.wait_ms, 30'000);
}

// ============================================================================
// Properties
// ============================================================================

TEST(EventSelectorContractTest, SelectionIsDeterministic) {
  auto schedule = ValidateAll({
      MakeEvent("a", 0, 60'000, {MakeTrack("t", 45.0)}),
      MakeEvent("b", 50'000, 120'000, {MakeTrack("t", 60.0)}),
  });
  for (int64_t offset = -10'000; offset <= 130'000; offset += 2'500) {
    auto first = EventSelector::Select(schedule, T + offset);
    auto second = EventSelector::IsEventActiveAt(schedule, T + offset);
    ASSERT_EQ(first.kind, second.kind);
    if (first.window) EXPECT_EQ(first.window->event, second.window->event);
  }
}

TEST(EventSelectorContractTest, ActiveResultAlwaysInsideEffectiveWindow) {
  auto schedule = ValidateAll({
      MakeEvent("a", 0, 60'000, {MakeTrack("t", 45.0)}),
      MakeEvent("b", 50'000, 120'000, {MakeTrack("t", 60.0), MakeTrack("u", 30.0)}),
      MakeEvent("c", 200'000, 210'000, {MakeTrack("t", 600.0)}),
  });
  for (int64_t offset = -5'000; offset <= 250'000; offset += 1'000) {
    const int64_t now = T + offset;
    auto r = EventSelector::Select(schedule, now);
    if (r.IsActive()) {
      EXPECT_LE(r.window->start_utc_ms, now);
      EXPECT_LT(now, r.window->effective_end_utc_ms);
      EXPECT_EQ(r.elapsed_ms, now - r.window->start_utc_ms);
    } else if (r.IsUpcoming()) {
      EXPECT_GT(r.wait_ms, 0);
      EXPECT_EQ(r.window->start_utc_ms, now + r.wait_ms);
    }
  }
}

TEST(EventSelectorContractTest, ClassifyWindowIsExhaustive) {
  EXPECT_EQ(EventSelector::ClassifyWindow(99, 100, 200), WindowClassification::kUpcoming);
  EXPECT_EQ(EventSelector::ClassifyWindow(100, 100, 200), WindowClassification::kActive);
  EXPECT_EQ(EventSelector::ClassifyWindow(199, 100, 200), WindowClassification::kActive);
  EXPECT_EQ(EventSelector::ClassifyWindow(200, 100, 200), WindowClassification::kElapsed);
  EXPECT_STREQ(WindowClassificationToString(WindowClassification::kActive), "ACTIVE");
}

TEST(EventSelectorContractTest, EffectiveEndIsMinOfDeclaredAndAudio) {
  EXPECT_EQ(EventSelector::ComputeEffectiveEndMs(0, 3'600'000, 180.0), 180'000);
  EXPECT_EQ(EventSelector::ComputeEffectiveEndMs(0, 60'000, 180.0), 60'000);
  EXPECT_EQ(EventSelector::ComputeEffectiveEndMs(0, 60'000, 0.0), 0);
  EXPECT_EQ(EventSelector::ComputeEffectiveEndMs(1'000, 500, 10.0), 1'000);
  EXPECT_EQ(EventSelector::ComputeEffectiveEndMs(0, 60'000, 1e300), 60'000);
}

TEST(EventSelectorContractTest, KindNamesAreStable) {
  EXPECT_STREQ(SelectionKindToString(SelectionKind::kNone), "none");
  EXPECT_STREQ(SelectionKindToString(SelectionKind::kUpcoming), "upcoming");
  EXPECT_STREQ(SelectionKindToString(SelectionKind::kActive), "active");
}

}  // namespace
}  // namespace schedcast::schedule
