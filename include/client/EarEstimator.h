#pragma once

#include <optional>

#include "client/EyeTypes.h"

namespace dg::client {

struct EarReading {
  std::optional<double> left_ear;
  std::optional<double> right_ear;
  EarSample sample = EarSample::Absent();
};

class EarEstimator {
 public:
  // (|p1-p5| + |p2-p4|) / (2 |p0-p3|). Empty when the landmarks are invalid:
  // zero horizontal extent or non-finite coordinates.
  static std::optional<double> ComputeEAR(const EyeLandmarks& eye);

  // Mean of both eyes, falling back to whichever eye is valid. Absent when
  // neither eye is usable.
  static EarReading Estimate(const EyeLandmarks& left_eye,
                             const EyeLandmarks& right_eye);
  static EarReading Estimate(const std::optional<FaceLandmarks>& face);
};

}  // namespace dg::client
