#include "core/Calibrator.h"

#include <algorithm>

namespace ag::core {

Calibrator::Calibrator(const ScoringConfig& config)
    : calib_seconds_(config.calib_seconds),
      target_default_(config.ear_target_default),
      target_min_(config.ear_target_min),
      target_max_(config.ear_target_max),
      running_(false),
      finished_(false),
      start_time_(0.0) {}

void Calibrator::Update(bool present, double gaze_h, double gaze_v,
                        double ear, double now) {
  if (!present) {
    return;
  }
  if (!target_ && !running_ && !finished_) {
    running_ = true;
    start_time_ = now;
    samples_.clear();
  }
  if (!running_) {
    return;
  }
  if (gaze_h == 0.0 && gaze_v == 0.0) {
    samples_.push_back(ear);
  }
  if (now - start_time_ >= calib_seconds_) {
    Finish();
  }
}

void Calibrator::Finish() {
  running_ = false;
  finished_ = true;
  if (samples_.empty()) {
    return;
  }
  const double m =
      std::min(std::max(Median(samples_), target_min_), target_max_);
  target_ = std::min(target_default_, m);
}

double Calibrator::EffectiveTarget() const {
  if (target_) {
    return *target_;
  }
  return target_default_;
}

double Calibrator::Median(std::vector<double> values) {
  if (values.empty()) {
    return 0.0;
  }
  std::sort(values.begin(), values.end());
  const std::size_t mid = values.size() / 2;
  if (values.size() % 2 == 1) {
    return values[mid];
  }
  return (values[mid - 1] + values[mid]) * 0.5;
}

}  // namespace ag::core
