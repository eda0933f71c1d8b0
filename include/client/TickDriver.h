#pragma once

#include <atomic>
#include <optional>

#include "core/ScoringConfig.h"
#include "core/Session.h"
#include "core/Types.h"

namespace ag::client {

// Feeds frames into a Session at no more than the configured processing
// rate. Pause/Resume/Quit may be called from a control thread.
class TickDriver {
 public:
  explicit TickDriver(const core::ScoringConfig& config, bool start_paused = false);

  std::optional<core::ScoreSample> SupplyTick(const core::FrameSignal& frame);

  void Pause();
  void Resume();
  void Quit();
  bool IsPaused() const;
  bool IsQuitRequested() const;

  const core::Session& session() const { return session_; }

 private:
  core::Session session_;
  double min_interval_;
  std::optional<double> last_tick_;
  std::atomic<bool> paused_;
  std::atomic<bool> quit_;
};

}  // namespace ag::client
