#include "core/Session.h"

#include "core/ScoreModel.h"

namespace ag::core {

Session::Session(const ScoringConfig& config)
    : config_(config),
      presence_(config),
      blink_(config),
      calibrator_(config),
      smoother_(config) {}

ScoreSample Session::ProcessTick(const FrameSignal& frame) {
  const PresenceUpdate presence = presence_.Update(frame.detected);

  ScoreSample sample;
  sample.timestamp = frame.timestamp;

  if (!frame.detected) {
    // Latched frames without a face hold the score until the miss run
    // drops the latch.
    sample.score =
        presence.present ? smoother_.score() : smoother_.DecayAbsent();
    return sample;
  }

  const int streak = blink_.Update(frame.ear);
  calibrator_.Update(presence.present, frame.gaze_h, frame.gaze_v, frame.ear,
                     frame.timestamp);
  const double raw =
      ComputeRawScore(frame.gaze_h, frame.gaze_v, frame.ear, streak,
                      calibrator_.EffectiveTarget());
  sample.score = smoother_.ApplyRaw(raw, presence.just_acquired,
                                    config_.start_at_100, frame.timestamp);
  sample.ear = frame.ear;
  sample.gaze_h = frame.gaze_h;
  sample.gaze_v = frame.gaze_v;
  return sample;
}

PresenceState Session::State() const {
  return presence_.IsPresent() ? PresenceState::kPresent
                               : PresenceState::kAbsent;
}

bool Session::IsCalibrating() const {
  return calibrator_.IsRunning();
}

bool Session::IsWarmingUp() const {
  return smoother_.IsWarmingUp() && !config_.start_at_100;
}

std::optional<double> Session::CalibrationTarget() const {
  return calibrator_.target();
}

}  // namespace ag::core
