#include "client/TickDriver.h"

#include <algorithm>

namespace ag::client {

TickDriver::TickDriver(const core::ScoringConfig& config, bool start_paused)
    : session_(config),
      min_interval_(1.0 / std::max(1, config.processing_fps)),
      paused_(start_paused),
      quit_(false) {}

std::optional<core::ScoreSample> TickDriver::SupplyTick(
    const core::FrameSignal& frame) {
  if (quit_.load() || paused_.load()) {
    return std::nullopt;
  }
  if (last_tick_ && frame.timestamp - *last_tick_ < min_interval_) {
    return std::nullopt;
  }
  last_tick_ = frame.timestamp;
  return session_.ProcessTick(frame);
}

void TickDriver::Pause() {
  paused_.store(true);
}

void TickDriver::Resume() {
  paused_.store(false);
}

void TickDriver::Quit() {
  quit_.store(true);
}

bool TickDriver::IsPaused() const {
  return paused_.load();
}

bool TickDriver::IsQuitRequested() const {
  return quit_.load();
}

}  // namespace ag::client
