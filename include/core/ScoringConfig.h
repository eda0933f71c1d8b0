#pragma once

namespace ag::core {

struct ScoringConfig {
  // Face presence hysteresis
  int hit_consec = 3;
  int miss_consec = 6;

  // Personal EAR calibration
  double calib_seconds = 2.0;
  double ear_target_default = 0.25;
  double ear_target_min = 0.20;
  double ear_target_max = 0.30;

  // Blink run
  double ear_closed_thresh = 0.21;
  int blink_streak_max = 10;

  // Smoothing
  double ema_alpha = 0.30;
  double warmup_seconds = 1.5;
  double warmup_start_score = 40.0;
  double warmup_end_score = 100.0;
  double max_rise_per_step = 2.5;
  double max_fall_per_step = 100.0;
  double absent_decay_per_step = 1.5;

  bool start_at_100 = false;
  int processing_fps = 10;
};

// Defaults overridden by AG_* environment variables.
ScoringConfig LoadScoringConfig();

}  // namespace ag::core
