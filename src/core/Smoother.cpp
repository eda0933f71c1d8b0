#include "core/Smoother.h"

#include <algorithm>

namespace ag::core {

namespace {

double SlewLimit(double prev, double target, double rise, double fall) {
  if (target > prev) {
    return std::min(target, prev + rise);
  }
  return std::max(target, prev - fall);
}

}  // namespace

Smoother::Smoother(const ScoringConfig& config)
    : ema_alpha_(config.ema_alpha),
      warmup_seconds_(config.warmup_seconds),
      warmup_start_score_(config.warmup_start_score),
      warmup_end_score_(config.warmup_end_score),
      max_rise_per_step_(config.max_rise_per_step),
      max_fall_per_step_(config.max_fall_per_step),
      absent_decay_per_step_(config.absent_decay_per_step),
      ema_score_(config.start_at_100 ? 100.0 : config.warmup_start_score),
      warmup_active_(false),
      warmup_start_(0.0) {}

double Smoother::ApplyRaw(double raw, bool just_acquired, bool start_at_100,
                          double now) {
  if (just_acquired) {
    warmup_active_ = true;
    warmup_start_ = now;
    if (!start_at_100) {
      ema_score_ = std::min(ema_score_, warmup_start_score_);
    }
  }

  double target = (1.0 - ema_alpha_) * ema_score_ + ema_alpha_ * raw;
  if (warmup_active_ && !start_at_100) {
    const double t = now - warmup_start_;
    if (t >= warmup_seconds_) {
      warmup_active_ = false;
    } else {
      const double allow =
          warmup_start_score_ +
          (warmup_end_score_ - warmup_start_score_) * (t / warmup_seconds_);
      target = std::min(target, allow);
    }
  }

  ema_score_ = std::clamp(
      SlewLimit(ema_score_, target, max_rise_per_step_, max_fall_per_step_),
      0.0, 100.0);
  return ema_score_;
}

double Smoother::DecayAbsent() {
  ema_score_ = std::max(0.0, ema_score_ - absent_decay_per_step_);
  return ema_score_;
}

}  // namespace ag::core
