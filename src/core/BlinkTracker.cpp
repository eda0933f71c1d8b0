#include "core/BlinkTracker.h"

#include <algorithm>

namespace ag::core {

BlinkTracker::BlinkTracker(const ScoringConfig& config)
    : ear_closed_thresh_(config.ear_closed_thresh),
      streak_max_(config.blink_streak_max),
      was_closed_(false),
      streak_(0) {}

int BlinkTracker::Update(double ear) {
  if (ear < ear_closed_thresh_) {
    if (was_closed_) {
      streak_ = std::min(streak_max_, streak_ + 1);
    } else {
      was_closed_ = true;
      streak_ = 1;
    }
  } else {
    // Recovery runs twice as fast as onset.
    was_closed_ = false;
    streak_ = std::max(0, streak_ - 2);
  }
  return streak_;
}

}  // namespace ag::core
