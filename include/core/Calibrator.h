#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "core/ScoringConfig.h"

namespace ag::core {

// One-shot personal EAR baseline. Collects EAR while the face is present
// and the gaze is centered, then settles on the clamped median once the
// window has elapsed. An empty window leaves the baseline unset for the
// rest of the session.
class Calibrator {
 public:
  explicit Calibrator(const ScoringConfig& config);

  void Update(bool present, double gaze_h, double gaze_v, double ear,
              double now);

  // Calibrated target if set, otherwise the default. Never above the
  // default.
  double EffectiveTarget() const;

  bool IsRunning() const { return running_; }
  bool HasFinished() const { return finished_; }
  std::optional<double> target() const { return target_; }
  std::size_t SampleCount() const { return samples_.size(); }

  static double Median(std::vector<double> values);

 private:
  void Finish();

  double calib_seconds_;
  double target_default_;
  double target_min_;
  double target_max_;

  bool running_;
  bool finished_;
  double start_time_;
  std::vector<double> samples_;
  std::optional<double> target_;
};

}  // namespace ag::core
