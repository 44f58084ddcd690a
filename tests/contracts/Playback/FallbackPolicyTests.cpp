// Repository: Schedcast-air
// Component: Fallback Policy Tests
// Purpose: Default-event resolution order and candidate filtering.
// Copyright (c) 2025 Schedcast

#include <gtest/gtest.h>

#include <memory>

#include "../../support/ScheduleBuilders.hpp"
#include "schedcast/playback/FallbackPolicy.hpp"

namespace schedcast::playback {
namespace {

using testing::MakeEvent;
using testing::MakeSnapshot;
using testing::MakeTrack;

schedule::EventPtr Shared(schedule::Event e) {
  return std::make_shared<const schedule::Event>(std::move(e));
}

TEST(FallbackPolicyTest, ExplicitPayloadWins) {
  auto explicit_default = Shared(MakeEvent("loop", 0, 1, {MakeTrack("x", 30.0)}));
  auto schedule = MakeSnapshot({MakeEvent("d", 0, 1, {MakeTrack("t", 30.0)}, "Default")});

  auto r = FallbackPolicy::ResolveDefaultEvent(explicit_default, schedule, "d");
  ASSERT_TRUE(r.found());
  EXPECT_EQ(r.event, explicit_default);
  EXPECT_EQ(r.origin, FallbackOrigin::kExplicit);
}

TEST(FallbackPolicyTest, ExplicitPayloadWithoutTracksIsPassedOver) {
  auto empty_default = Shared(MakeEvent("loop", 0, 1, {}));
  auto schedule = MakeSnapshot({MakeEvent("d", 0, 1, {MakeTrack("t", 30.0)}, "Default")});

  auto r = FallbackPolicy::ResolveDefaultEvent(empty_default, schedule, "");
  ASSERT_TRUE(r.found());
  EXPECT_EQ(r.event->id, "d");
  EXPECT_EQ(r.origin, FallbackOrigin::kNameMatch);
}

TEST(FallbackPolicyTest, ConfiguredIdMatchesCaseInsensitively) {
  auto schedule = MakeSnapshot({
      MakeEvent("Default", 0, 1, {MakeTrack("t", 30.0)}, "Default"),
      MakeEvent("House-Loop", 0, 1, {MakeTrack("t", 30.0)}, "Loop"),
  });
  auto r = FallbackPolicy::ResolveDefaultEvent(nullptr, schedule, "  house-loop ");
  ASSERT_TRUE(r.found());
  EXPECT_EQ(r.event->id, "House-Loop");
  EXPECT_EQ(r.origin, FallbackOrigin::kIdMatch);
}

TEST(FallbackPolicyTest, FallsBackToEventNamedDefault) {
  auto schedule = MakeSnapshot({
      MakeEvent("a", 0, 1, {MakeTrack("t", 30.0)}, "Morning"),
      MakeEvent("b", 0, 1, {MakeTrack("t", 30.0)}, "  DEFAULT  "),
      MakeEvent("c", 0, 1, {MakeTrack("t", 30.0)}, "default"),
  });
  auto r = FallbackPolicy::ResolveDefaultEvent(nullptr, schedule, "missing-id");
  ASSERT_TRUE(r.found());
  EXPECT_EQ(r.event->id, "b");
  EXPECT_EQ(r.origin, FallbackOrigin::kNameMatch);
}

TEST(FallbackPolicyTest, CandidatesWithoutTracksAreSkipped) {
  auto schedule = MakeSnapshot({
      MakeEvent("d1", 0, 1, {}, "Default"),
      MakeEvent("d2", 0, 1, {MakeTrack("t", 30.0)}, "Default"),
  });
  auto r = FallbackPolicy::ResolveDefaultEvent(nullptr, schedule, "d1");
  ASSERT_TRUE(r.found());
  EXPECT_EQ(r.event->id, "d2");
}

TEST(FallbackPolicyTest, NothingFound) {
  auto schedule = MakeSnapshot({MakeEvent("a", 0, 1, {MakeTrack("t", 30.0)}, "Defaults")});
  auto r = FallbackPolicy::ResolveDefaultEvent(nullptr, schedule, "");
  EXPECT_FALSE(r.found());
  EXPECT_EQ(r.origin, FallbackOrigin::kNone);
  EXPECT_FALSE(FallbackPolicy::ResolveDefaultEvent(nullptr, nullptr, "a").found());
}

TEST(FallbackPolicyTest, StringHelpers) {
  EXPECT_TRUE(FallbackPolicy::EqualsIgnoreCase("DeFault", "default"));
  EXPECT_FALSE(FallbackPolicy::EqualsIgnoreCase("default ", "default"));
  EXPECT_EQ(FallbackPolicy::Trim("\t x y \n"), "x y");
  EXPECT_EQ(FallbackPolicy::Trim("   "), "");
  EXPECT_STREQ(FallbackOriginToString(FallbackOrigin::kIdMatch), "id_match");
}

}  // namespace
}  // namespace schedcast::playback
