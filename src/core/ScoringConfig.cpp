#include "core/ScoringConfig.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace ag::core {

namespace {

bool ReadEnvDouble(const char* name, double& out) {
  const char* v = std::getenv(name);
  if (v == nullptr || *v == '\0') {
    return false;
  }
  char* end = nullptr;
  const double parsed = std::strtod(v, &end);
  if (end == v || *end != '\0') {
    std::cerr << "[ScoringConfig] Ignoring invalid " << name << "=" << v
              << std::endl;
    return false;
  }
  out = parsed;
  return true;
}

bool ReadEnvInt(const char* name, int& out) {
  const char* v = std::getenv(name);
  if (v == nullptr || *v == '\0') {
    return false;
  }
  char* end = nullptr;
  const long parsed = std::strtol(v, &end, 10);
  if (end == v || *end != '\0') {
    std::cerr << "[ScoringConfig] Ignoring invalid " << name << "=" << v
              << std::endl;
    return false;
  }
  out = static_cast<int>(parsed);
  return true;
}

bool ReadEnvBool(const char* name, bool& out) {
  const char* v = std::getenv(name);
  if (v == nullptr || *v == '\0') {
    return false;
  }
  const std::string s(v);
  if (s == "1" || s == "true" || s == "on" || s == "yes") {
    out = true;
    return true;
  }
  if (s == "0" || s == "false" || s == "off" || s == "no") {
    out = false;
    return true;
  }
  std::cerr << "[ScoringConfig] Ignoring invalid " << name << "=" << v
            << std::endl;
  return false;
}

void RejectOverride(const std::string& what) {
  std::cerr << "[ScoringConfig] Ignoring inconsistent " << what << std::endl;
}

// Reverts overrides that would break the invariants the scoring stages rely on.
void DropInconsistentOverrides(ScoringConfig& cfg) {
  const ScoringConfig defaults;
  if (cfg.hit_consec < 1) {
    RejectOverride("AG_HIT_CONSEC=" + std::to_string(cfg.hit_consec));
    cfg.hit_consec = defaults.hit_consec;
  }
  if (cfg.miss_consec < 1) {
    RejectOverride("AG_MISS_CONSEC=" + std::to_string(cfg.miss_consec));
    cfg.miss_consec = defaults.miss_consec;
  }
  if (cfg.blink_streak_max < 1) {
    RejectOverride("AG_BLINK_STREAK_MAX=" +
                   std::to_string(cfg.blink_streak_max));
    cfg.blink_streak_max = defaults.blink_streak_max;
  }
  if (cfg.ema_alpha < 0.0 || cfg.ema_alpha > 1.0) {
    RejectOverride("AG_EMA_ALPHA=" + std::to_string(cfg.ema_alpha));
    cfg.ema_alpha = defaults.ema_alpha;
  }
  if (cfg.ear_target_min > cfg.ear_target_max ||
      cfg.ear_target_min > cfg.ear_target_default) {
    RejectOverride("EAR target range min=" + std::to_string(cfg.ear_target_min) +
                   " max=" + std::to_string(cfg.ear_target_max) +
                   " default=" + std::to_string(cfg.ear_target_default));
    cfg.ear_target_default = defaults.ear_target_default;
    cfg.ear_target_min = defaults.ear_target_min;
    cfg.ear_target_max = defaults.ear_target_max;
  }
}

}  // namespace

ScoringConfig LoadScoringConfig() {
  ScoringConfig cfg;
  ReadEnvInt("AG_HIT_CONSEC", cfg.hit_consec);
  ReadEnvInt("AG_MISS_CONSEC", cfg.miss_consec);
  ReadEnvDouble("AG_CALIB_SECONDS", cfg.calib_seconds);
  ReadEnvDouble("AG_EAR_TARGET_DEFAULT", cfg.ear_target_default);
  ReadEnvDouble("AG_EAR_TARGET_MIN", cfg.ear_target_min);
  ReadEnvDouble("AG_EAR_TARGET_MAX", cfg.ear_target_max);
  ReadEnvDouble("AG_EAR_CLOSED_THRESH", cfg.ear_closed_thresh);
  ReadEnvInt("AG_BLINK_STREAK_MAX", cfg.blink_streak_max);
  ReadEnvDouble("AG_EMA_ALPHA", cfg.ema_alpha);
  ReadEnvDouble("AG_WARMUP_SECONDS", cfg.warmup_seconds);
  ReadEnvDouble("AG_WARMUP_START_SCORE", cfg.warmup_start_score);
  ReadEnvDouble("AG_WARMUP_END_SCORE", cfg.warmup_end_score);
  ReadEnvDouble("AG_MAX_RISE_PER_STEP", cfg.max_rise_per_step);
  ReadEnvDouble("AG_MAX_FALL_PER_STEP", cfg.max_fall_per_step);
  ReadEnvDouble("AG_ABSENT_DECAY_PER_STEP", cfg.absent_decay_per_step);
  ReadEnvBool("AG_START_100", cfg.start_at_100);
  ReadEnvInt("AG_FPS", cfg.processing_fps);
  if (cfg.processing_fps < 1) {
    cfg.processing_fps = 1;
  }
  DropInconsistentOverrides(cfg);
  return cfg;
}

}  // namespace ag::core
