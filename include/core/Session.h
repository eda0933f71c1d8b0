#pragma once

#include <optional>

#include "core/BlinkTracker.h"
#include "core/Calibrator.h"
#include "core/PresenceGate.h"
#include "core/ScoringConfig.h"
#include "core/Smoother.h"
#include "core/Types.h"

namespace ag::core {

enum class PresenceState {
  kAbsent,
  kPresent,
};

// Owns all mutable scoring state for one run. Single writer: only the
// thread driving ProcessTick may touch it.
class Session {
 public:
  explicit Session(const ScoringConfig& config);

  ScoreSample ProcessTick(const FrameSignal& frame);

  PresenceState State() const;
  bool IsCalibrating() const;
  bool IsWarmingUp() const;
  std::optional<double> CalibrationTarget() const;
  double score() const { return smoother_.score(); }
  const ScoringConfig& config() const { return config_; }

 private:
  ScoringConfig config_;
  PresenceGate presence_;
  BlinkTracker blink_;
  Calibrator calibrator_;
  Smoother smoother_;
};

}  // namespace ag::core
