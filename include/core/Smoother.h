#pragma once

#include "core/ScoringConfig.h"

namespace ag::core {

// EMA + warm-up ceiling + slew limiting over the raw score, plus the
// linear decay used while no face is present.
class Smoother {
 public:
  explicit Smoother(const ScoringConfig& config);

  double ApplyRaw(double raw, bool just_acquired, bool start_at_100,
                  double now);
  double DecayAbsent();

  double score() const { return ema_score_; }
  bool IsWarmingUp() const { return warmup_active_; }

 private:
  double ema_alpha_;
  double warmup_seconds_;
  double warmup_start_score_;
  double warmup_end_score_;
  double max_rise_per_step_;
  double max_fall_per_step_;
  double absent_decay_per_step_;

  double ema_score_;
  bool warmup_active_;
  double warmup_start_;
};

}  // namespace ag::core
