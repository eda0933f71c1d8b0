#include "client/FeatureExtractor.h"

#include <algorithm>
#include <cmath>

namespace ag::client {

namespace {

constexpr float kMinEyeWidth = 1e-6f;
constexpr float kGazeScaleX = 0.5f;
constexpr float kGazeScaleY = 0.4f;

float Clamp01(float x) {
  return std::max(0.0f, std::min(1.0f, x));
}

cv::Point2f CenterOf(const std::vector<cv::Point2f>& pts) {
  cv::Point2f sum(0.0f, 0.0f);
  for (const auto& p : pts) {
    sum += p;
  }
  return sum * (1.0f / static_cast<float>(pts.size()));
}

}  // namespace

FeatureExtractor::FeatureExtractor(float deadzone_x, float deadzone_y)
    : deadzone_x_(deadzone_x), deadzone_y_(deadzone_y) {}

float FeatureExtractor::ComputeEAR(const std::vector<cv::Point2f>& eye) const {
  if (eye.size() != 6) {
    return 0.0f;
  }
  const float a = static_cast<float>(cv::norm(eye[1] - eye[5]));
  const float b = static_cast<float>(cv::norm(eye[2] - eye[4]));
  const float c = static_cast<float>(cv::norm(eye[0] - eye[3]));
  if (c < kMinEyeWidth) {
    return 0.0f;
  }
  return (a + b) / (2.0f * c);
}

GazeOffset FeatureExtractor::ComputeGazeOffset(
    const std::vector<cv::Point2f>& eye,
    const std::vector<cv::Point2f>& iris) const {
  GazeOffset offset;
  if (eye.size() != 6 || iris.empty()) {
    return offset;
  }
  const float eye_w = static_cast<float>(cv::norm(eye[0] - eye[3]));
  if (eye_w < kMinEyeWidth) {
    return offset;
  }
  const cv::Point2f d = (CenterOf(iris) - CenterOf(eye)) * (1.0f / eye_w);
  const float dx = std::abs(d.x) < deadzone_x_ ? 0.0f : d.x;
  const float dy = std::abs(d.y) < deadzone_y_ ? 0.0f : d.y;
  offset.horizontal = Clamp01(std::abs(dx) / kGazeScaleX);
  offset.vertical = Clamp01(std::abs(dy) / kGazeScaleY);
  return offset;
}

core::FrameSignal FeatureExtractor::Extract(const EyeLandmarks& left,
                                            const EyeLandmarks& right,
                                            double timestamp) const {
  const GazeOffset gl = ComputeGazeOffset(left.eye, left.iris);
  const GazeOffset gr = ComputeGazeOffset(right.eye, right.iris);

  core::FrameSignal frame;
  frame.timestamp = timestamp;
  frame.ear = (ComputeEAR(left.eye) + ComputeEAR(right.eye)) * 0.5f;
  frame.gaze_h = (gl.horizontal + gr.horizontal) * 0.5f;
  frame.gaze_v = (gl.vertical + gr.vertical) * 0.5f;
  frame.detected = true;
  return frame;
}

core::FrameSignal FeatureExtractor::Missing(double timestamp) const {
  core::FrameSignal frame;
  frame.timestamp = timestamp;
  frame.detected = false;
  return frame;
}

}  // namespace ag::client
