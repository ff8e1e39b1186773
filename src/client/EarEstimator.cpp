#include "client/EarEstimator.h"

#include <cmath>

namespace dg::client {

namespace {

bool IsFinite(const cv::Point2d& p) {
  return std::isfinite(p.x) && std::isfinite(p.y);
}

}  // namespace

std::optional<double> EarEstimator::ComputeEAR(const EyeLandmarks& eye) {
  for (const auto& p : eye) {
    if (!IsFinite(p)) {
      return std::nullopt;
    }
  }
  const double a = cv::norm(eye[1] - eye[5]);
  const double b = cv::norm(eye[2] - eye[4]);
  const double c = cv::norm(eye[0] - eye[3]);
  if (c <= 0.0) {
    return std::nullopt;
  }
  return (a + b) / (2.0 * c);
}

EarReading EarEstimator::Estimate(const EyeLandmarks& left_eye,
                                  const EyeLandmarks& right_eye) {
  EarReading reading;
  reading.left_ear = ComputeEAR(left_eye);
  reading.right_ear = ComputeEAR(right_eye);

  if (reading.left_ear && reading.right_ear) {
    reading.sample =
        EarSample::Present((*reading.left_ear + *reading.right_ear) / 2.0);
  } else if (reading.left_ear) {
    reading.sample = EarSample::Present(*reading.left_ear);
  } else if (reading.right_ear) {
    reading.sample = EarSample::Present(*reading.right_ear);
  }
  return reading;
}

EarReading EarEstimator::Estimate(const std::optional<FaceLandmarks>& face) {
  if (!face) {
    return EarReading{};
  }
  return Estimate(face->left_eye, face->right_eye);
}

}  // namespace dg::client
