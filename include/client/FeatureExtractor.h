#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "core/Types.h"

namespace ag::client {

// Six eye contour points in p1..p6 order (p1/p4 are the corners) and the
// iris ring points for the same eye.
struct EyeLandmarks {
  std::vector<cv::Point2f> eye;
  std::vector<cv::Point2f> iris;
};

struct GazeOffset {
  float horizontal = 0.0f;
  float vertical = 0.0f;
};

class FeatureExtractor {
 public:
  FeatureExtractor(float deadzone_x = 0.10f, float deadzone_y = 0.08f);

  float ComputeEAR(const std::vector<cv::Point2f>& eye) const;
  GazeOffset ComputeGazeOffset(const std::vector<cv::Point2f>& eye,
                               const std::vector<cv::Point2f>& iris) const;

  core::FrameSignal Extract(const EyeLandmarks& left,
                            const EyeLandmarks& right,
                            double timestamp) const;
  core::FrameSignal Missing(double timestamp) const;

 private:
  float deadzone_x_;
  float deadzone_y_;
};

}  // namespace ag::client
