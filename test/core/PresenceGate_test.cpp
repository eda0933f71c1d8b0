#include "core/PresenceGate.h"

#include <gtest/gtest.h>

namespace ag::core {
namespace {

TEST(PresenceGate, StartsAbsent) {
  PresenceGate gate(ScoringConfig{});
  EXPECT_FALSE(gate.IsPresent());
  EXPECT_EQ(gate.hits(), 0);
  EXPECT_EQ(gate.misses(), 0);
}

TEST(PresenceGate, ShortHitRunFollowedByMissNeverAcquires) {
  PresenceGate gate(ScoringConfig{});
  EXPECT_FALSE(gate.Update(true).present);
  EXPECT_FALSE(gate.Update(true).present);
  PresenceUpdate u = gate.Update(false);
  EXPECT_FALSE(u.present);
  EXPECT_FALSE(u.just_acquired);
  EXPECT_EQ(gate.hits(), 0);
}

TEST(PresenceGate, AcquiresOnThirdConsecutiveHit) {
  PresenceGate gate(ScoringConfig{});
  gate.Update(true);
  gate.Update(true);
  PresenceUpdate u = gate.Update(true);
  EXPECT_TRUE(u.present);
  EXPECT_TRUE(u.just_acquired);

  u = gate.Update(true);
  EXPECT_TRUE(u.present);
  EXPECT_FALSE(u.just_acquired);
}

TEST(PresenceGate, ReleasesOnlyAfterFullMissRun) {
  PresenceGate gate(ScoringConfig{});
  for (int i = 0; i < 3; ++i) gate.Update(true);

  for (int i = 0; i < 5; ++i) {
    EXPECT_TRUE(gate.Update(false).present) << "miss " << i + 1;
  }
  PresenceUpdate u = gate.Update(false);
  EXPECT_FALSE(u.present);
  EXPECT_FALSE(u.just_acquired);
}

TEST(PresenceGate, PartialMissRunKeepsLatch) {
  PresenceGate gate(ScoringConfig{});
  for (int i = 0; i < 3; ++i) gate.Update(true);
  for (int i = 0; i < 4; ++i) gate.Update(false);

  PresenceUpdate u = gate.Update(true);
  EXPECT_TRUE(u.present);
  EXPECT_FALSE(u.just_acquired);
  EXPECT_EQ(gate.misses(), 0);
  EXPECT_EQ(gate.hits(), 1);
}

TEST(PresenceGate, ReacquireFiresEdgeAgain) {
  PresenceGate gate(ScoringConfig{});
  for (int i = 0; i < 3; ++i) gate.Update(true);
  for (int i = 0; i < 6; ++i) gate.Update(false);
  ASSERT_FALSE(gate.IsPresent());

  gate.Update(true);
  gate.Update(true);
  EXPECT_TRUE(gate.Update(true).just_acquired);
}

TEST(PresenceGate, CountersAreCapped) {
  PresenceGate gate(ScoringConfig{});
  for (int i = 0; i < 20; ++i) gate.Update(true);
  EXPECT_EQ(gate.hits(), 3);
  for (int i = 0; i < 20; ++i) gate.Update(false);
  EXPECT_EQ(gate.misses(), 6);
}

TEST(PresenceGate, HonoursConfiguredThresholds) {
  ScoringConfig config;
  config.hit_consec = 1;
  config.miss_consec = 2;
  PresenceGate gate(config);
  EXPECT_TRUE(gate.Update(true).just_acquired);
  EXPECT_TRUE(gate.Update(false).present);
  EXPECT_FALSE(gate.Update(false).present);
}

}  // namespace
}  // namespace ag::core
