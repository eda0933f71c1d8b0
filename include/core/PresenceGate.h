#pragma once

#include "core/ScoringConfig.h"

namespace ag::core {

struct PresenceUpdate {
  bool present = false;
  bool just_acquired = false;
};

// Asymmetric hysteresis latch over the per-tick face detection flag.
// Turns on after hit_consec consecutive detections and off after
// miss_consec consecutive misses; shorter runs leave it unchanged.
class PresenceGate {
 public:
  explicit PresenceGate(const ScoringConfig& config);

  PresenceUpdate Update(bool detected);

  bool IsPresent() const;
  int hits() const { return hits_; }
  int misses() const { return misses_; }

 private:
  int hit_consec_;
  int miss_consec_;
  int hits_;
  int misses_;
  bool present_;
};

}  // namespace ag::core
