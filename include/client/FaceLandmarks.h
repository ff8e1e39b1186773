#pragma once

#include <optional>
#include <vector>

#include "client/EyeTypes.h"

namespace dg::client {

// iBUG 68-point layout, as produced by dlib's shape_predictor_68_face_landmarks.
constexpr int kFaceShapePoints = 68;
constexpr int kRightEyeBegin = 36;
constexpr int kLeftEyeBegin = 42;

// Empty when the shape is too short to contain both eyes.
std::optional<FaceLandmarks> ExtractEyes(const std::vector<cv::Point2d>& shape);

}  // namespace dg::client
