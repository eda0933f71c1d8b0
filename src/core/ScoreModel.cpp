#include "core/ScoreModel.h"

#include <algorithm>

namespace ag::core {

namespace {

constexpr double kGazeHWeight = 0.8;
constexpr double kGazeVWeight = 0.6;
constexpr double kEarWeight = 1.0;
constexpr double kBlinkWeight = 1.2;

constexpr double kGazeHSpan = 40.0;
constexpr double kGazeVSpan = 25.0;
constexpr double kEarSpan = 40.0;
constexpr double kBlinkSpan = 10.0;
constexpr double kBlinkStreakScale = 10.0;

constexpr double kBonusGazeLimit = 0.02;
constexpr double kBonusEarSlack = 0.01;
constexpr double kBonusFloor = 98.0;

}  // namespace

double Clamp01(double x) {
  return std::max(0.0, std::min(1.0, x));
}

double ComputeRawScore(double gaze_h, double gaze_v, double ear,
                       int blink_streak, double target) {
  double s = 100.0;
  s -= kGazeHWeight * Clamp01(gaze_h) * kGazeHSpan;
  s -= kGazeVWeight * Clamp01(gaze_v) * kGazeVSpan;
  s -= kEarWeight * std::max(0.0, target - std::max(0.0, ear)) * kEarSpan /
       std::max(target, 1e-6);
  s -= kBlinkWeight * Clamp01(blink_streak / kBlinkStreakScale) * kBlinkSpan;
  s = std::max(0.0, std::min(100.0, s));

  if (gaze_h < kBonusGazeLimit && gaze_v < kBonusGazeLimit &&
      blink_streak == 0 && ear >= target - kBonusEarSlack) {
    s = std::max(s, kBonusFloor);
  }
  return s;
}

}  // namespace ag::core
