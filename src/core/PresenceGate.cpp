#include "core/PresenceGate.h"

#include <algorithm>

namespace ag::core {

PresenceGate::PresenceGate(const ScoringConfig& config)
    : hit_consec_(config.hit_consec),
      miss_consec_(config.miss_consec),
      hits_(0),
      misses_(0),
      present_(false) {}

PresenceUpdate PresenceGate::Update(bool detected) {
  const bool was_present = present_;
  if (detected) {
    hits_ = std::min(hit_consec_, hits_ + 1);
    misses_ = 0;
    if (hits_ >= hit_consec_) {
      present_ = true;
    }
  } else {
    misses_ = std::min(miss_consec_, misses_ + 1);
    hits_ = 0;
    if (misses_ >= miss_consec_) {
      present_ = false;
    }
  }
  return PresenceUpdate{present_, present_ && !was_present};
}

bool PresenceGate::IsPresent() const {
  return present_;
}

}  // namespace ag::core
