#include "client/SyntheticLandmarkSource.h"

#include <algorithm>
#include <cmath>

#include "client/FaceLandmarks.h"

namespace dg::client {

namespace {

constexpr double kEyeWidth = 60.0;
constexpr double kEyeLineY = 200.0;
constexpr double kRightEyeOuterX = 210.0;
constexpr double kLeftEyeInnerX = 370.0;
constexpr double kPi = 3.14159265358979323846;

// Lid points sit at a third and two thirds of the eye width, so
// EAR = 4 * half_height / (2 * width).
void PlaceEye(std::vector<cv::Point2d>& shape, int begin, double x0, double ear) {
  const double half_height = ear * kEyeWidth / 2.0;
  const double x1 = x0 + kEyeWidth / 3.0;
  const double x2 = x0 + 2.0 * kEyeWidth / 3.0;
  shape[begin + 0] = {x0, kEyeLineY};
  shape[begin + 1] = {x1, kEyeLineY - half_height};
  shape[begin + 2] = {x2, kEyeLineY - half_height};
  shape[begin + 3] = {x0 + kEyeWidth, kEyeLineY};
  shape[begin + 4] = {x2, kEyeLineY + half_height};
  shape[begin + 5] = {x1, kEyeLineY + half_height};
}

void PlaceOutline(std::vector<cv::Point2d>& shape) {
  // Jaw 0..16 along the lower half of an ellipse.
  for (int i = 0; i <= 16; ++i) {
    const double t = kPi * i / 16.0;
    shape[i] = {320.0 - 150.0 * std::cos(t), 220.0 + 160.0 * std::sin(t)};
  }
  // Brows 17..26.
  for (int i = 17; i <= 26; ++i) {
    const double x = (i <= 21) ? 200.0 + (i - 17) * 20.0 : 360.0 + (i - 22) * 20.0;
    shape[i] = {x, 165.0};
  }
  // Nose bridge 27..30 and base 31..35.
  for (int i = 27; i <= 30; ++i) {
    shape[i] = {320.0, 200.0 + (i - 27) * 20.0};
  }
  for (int i = 31; i <= 35; ++i) {
    shape[i] = {300.0 + (i - 31) * 10.0, 290.0};
  }
  // Mouth 48..67 as two ellipses.
  for (int i = 48; i <= 59; ++i) {
    const double t = 2.0 * kPi * (i - 48) / 12.0;
    shape[i] = {320.0 - 50.0 * std::cos(t), 340.0 + 20.0 * std::sin(t)};
  }
  for (int i = 60; i <= 67; ++i) {
    const double t = 2.0 * kPi * (i - 60) / 8.0;
    shape[i] = {320.0 - 35.0 * std::cos(t), 340.0 + 8.0 * std::sin(t)};
  }
}

}  // namespace

SyntheticLandmarkSource::SyntheticLandmarkSource(std::vector<Segment> script)
    : script_(std::move(script)) {}

bool SyntheticLandmarkSource::NextFrame(std::vector<cv::Point2d>& shape) {
  while (segment_ < script_.size() && emitted_in_segment_ >= script_[segment_].frames) {
    segment_++;
    emitted_in_segment_ = 0;
  }
  if (segment_ >= script_.size()) {
    return false;
  }

  const Segment& current = script_[segment_];
  emitted_in_segment_++;
  if (!current.ear) {
    shape.clear();
  } else {
    shape = MakeFace(*current.ear, current.left_eye_valid);
  }
  return true;
}

std::vector<SyntheticLandmarkSource::Segment> SyntheticLandmarkSource::SelfTestScript(
    int consecutive_frames) {
  const int n = std::clamp(consecutive_frames, 1, kMaxSelfTestRun);
  const double open = 0.32;
  const double closed = 0.12;
  return {
      {open, 30, true},
      {closed, 3, true},
      {open, 15, true},
      {closed, n + 10, true},
      {std::nullopt, 5, true},
      {closed, std::max(n / 2, 1), true},
      {open, 10, false},
      {closed, n + 5, false},
      {open, 20, true},
  };
}

std::size_t SyntheticLandmarkSource::TotalFrames() const {
  std::size_t total = 0;
  for (const auto& segment : script_) {
    if (segment.frames > 0) total += static_cast<std::size_t>(segment.frames);
  }
  return total;
}

std::vector<cv::Point2d> SyntheticLandmarkSource::MakeFace(double ear, bool left_eye_valid) {
  std::vector<cv::Point2d> shape(kFaceShapePoints);
  PlaceOutline(shape);
  PlaceEye(shape, kRightEyeBegin, kRightEyeOuterX, ear);
  PlaceEye(shape, kLeftEyeBegin, kLeftEyeInnerX, ear);
  if (!left_eye_valid) {
    for (int i = 0; i < 6; ++i) {
      shape[kLeftEyeBegin + i] = {kLeftEyeInnerX, kEyeLineY};
    }
  }
  return shape;
}

}  // namespace dg::client
