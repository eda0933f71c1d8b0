#pragma once

namespace ag::core {

double Clamp01(double x);

// Raw attention score in [0, 100] from the current feature vector.
// Weights and the near-perfect-posture bonus are fixed.
double ComputeRawScore(double gaze_h, double gaze_v, double ear,
                       int blink_streak, double target);

}  // namespace ag::core
