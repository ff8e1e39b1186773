#include "client/FaceLandmarks.h"

namespace dg::client {

namespace {

EyeLandmarks SliceEye(const std::vector<cv::Point2d>& shape, int begin) {
  EyeLandmarks eye;
  for (size_t i = 0; i < eye.size(); ++i) {
    eye[i] = shape[begin + i];
  }
  return eye;
}

}  // namespace

std::optional<FaceLandmarks> ExtractEyes(const std::vector<cv::Point2d>& shape) {
  if (shape.size() < static_cast<size_t>(kLeftEyeBegin + 6)) {
    return std::nullopt;
  }
  FaceLandmarks face;
  face.right_eye = SliceEye(shape, kRightEyeBegin);
  face.left_eye = SliceEye(shape, kLeftEyeBegin);
  return face;
}

}  // namespace dg::client
