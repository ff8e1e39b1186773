#pragma once

#include <array>
#include <optional>

#include <opencv2/core.hpp>

namespace dg::client {

// Outer corner, two upper-lid points, inner corner, two lower-lid points.
using EyeLandmarks = std::array<cv::Point2d, 6>;

struct FaceLandmarks {
  EyeLandmarks left_eye;
  EyeLandmarks right_eye;
};

// One frame's eye-openness measurement. Absent means no usable face or eyes.
class EarSample {
 public:
  static EarSample Present(double value) { return EarSample(value); }
  static EarSample Absent() { return EarSample(); }

  bool IsPresent() const { return value_.has_value(); }
  double Value() const { return *value_; }
  const std::optional<double>& AsOptional() const { return value_; }

 private:
  EarSample() = default;
  explicit EarSample(double value) : value_(value) {}

  std::optional<double> value_;
};

}  // namespace dg::client
