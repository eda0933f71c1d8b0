#pragma once

#include "core/ScoringConfig.h"

namespace ag::core {

class BlinkTracker {
 public:
  explicit BlinkTracker(const ScoringConfig& config);

  // Returns the updated closed-eyes streak.
  int Update(double ear);

  int streak() const { return streak_; }
  bool IsClosed() const { return was_closed_; }

 private:
  double ear_closed_thresh_;
  int streak_max_;
  bool was_closed_;
  int streak_;
};

}  // namespace ag::core
