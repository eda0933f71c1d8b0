#include "core/ScoreModel.h"

#include <gtest/gtest.h>

namespace ag::core {
namespace {

TEST(ScoreModel, PerfectPostureScoresFull) {
  EXPECT_DOUBLE_EQ(ComputeRawScore(0.0, 0.0, 0.25, 0, 0.25), 100.0);
}

TEST(ScoreModel, GazeAndEarDeficitDeductions) {
  // 0.8*0.5*40 = 16 and 1.0*(0.25-0.15)*40/0.25 = 16
  EXPECT_NEAR(ComputeRawScore(0.5, 0.0, 0.15, 0, 0.25), 68.0, 1e-9);
}

TEST(ScoreModel, VerticalGazeDeduction) {
  EXPECT_NEAR(ComputeRawScore(0.0, 1.0, 0.30, 0, 0.25), 85.0, 1e-9);
}

TEST(ScoreModel, BlinkStreakDeductionAndNoBonus) {
  EXPECT_NEAR(ComputeRawScore(0.0, 0.0, 0.30, 10, 0.25), 88.0, 1e-9);
  EXPECT_NEAR(ComputeRawScore(0.0, 0.0, 0.30, 5, 0.25), 94.0, 1e-9);
}

TEST(ScoreModel, NearPerfectPostureBonusRaisesToFloor) {
  // 0.48 + 0.225 + 1.44 deducted -> 97.855, lifted to 98
  EXPECT_DOUBLE_EQ(ComputeRawScore(0.015, 0.015, 0.241, 0, 0.25), 98.0);
}

TEST(ScoreModel, BonusRequiresEarNearTarget) {
  const double s = ComputeRawScore(0.0, 0.0, 0.23, 0, 0.25);
  EXPECT_NEAR(s, 100.0 - 0.02 * 160.0, 1e-9);
  EXPECT_LT(s, 98.0);
}

TEST(ScoreModel, OutOfRangeInputsAreClamped) {
  EXPECT_NEAR(ComputeRawScore(5.0, 3.0, -1.0, 50, 0.25), 1.0, 1e-9);
  EXPECT_DOUBLE_EQ(ComputeRawScore(-1.0, -1.0, 0.25, 0, 0.25), 100.0);
}

TEST(ScoreModel, ZeroTargetDoesNotDivideByZero) {
  EXPECT_DOUBLE_EQ(ComputeRawScore(0.0, 0.0, 0.0, 0, 0.0), 100.0);
}

TEST(ScoreModel, AlwaysWithinRange) {
  for (double gh = 0.0; gh <= 1.0; gh += 0.25) {
    for (double gv = 0.0; gv <= 1.0; gv += 0.25) {
      for (double ear = 0.0; ear <= 0.4; ear += 0.05) {
        for (int streak = 0; streak <= 10; streak += 2) {
          const double s = ComputeRawScore(gh, gv, ear, streak, 0.22);
          EXPECT_GE(s, 0.0);
          EXPECT_LE(s, 100.0);
        }
      }
    }
  }
}

TEST(ScoreModel, Clamp01) {
  EXPECT_DOUBLE_EQ(Clamp01(-0.1), 0.0);
  EXPECT_DOUBLE_EQ(Clamp01(0.4), 0.4);
  EXPECT_DOUBLE_EQ(Clamp01(1.7), 1.0);
}

}  // namespace
}  // namespace ag::core
