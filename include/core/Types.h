#pragma once

namespace ag::core {

// Per-frame features supplied by the upstream extractor. gaze_h/gaze_v are
// already deadzone-squashed into [0, 1].
struct FrameSignal {
  double timestamp = 0.0;
  double ear = 0.0;
  double gaze_h = 0.0;
  double gaze_v = 0.0;
  bool detected = false;
};

// One row of telemetry: timestamp, score, ear, gaze_h, gaze_v.
struct ScoreSample {
  double timestamp = 0.0;
  double score = 0.0;
  double ear = 0.0;
  double gaze_h = 0.0;
  double gaze_v = 0.0;
};

}  // namespace ag::core
