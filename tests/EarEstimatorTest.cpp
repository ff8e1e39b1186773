#include "client/EarEstimator.h"

#include <cmath>
#include <limits>

#include <gtest/gtest.h>

namespace dg::client {
namespace {

// Eye of the given width whose lids sit `half_height` above and below the
// corner line at one and two thirds of the width.
EyeLandmarks MakeEye(double width, double half_height, double x0 = 0.0, double y0 = 0.0) {
  return {{
      {x0, y0},
      {x0 + width / 3.0, y0 - half_height},
      {x0 + 2.0 * width / 3.0, y0 - half_height},
      {x0 + width, y0},
      {x0 + 2.0 * width / 3.0, y0 + half_height},
      {x0 + width / 3.0, y0 + half_height},
  }};
}

TEST(EarEstimatorTest, ComputesRatioOfLidDistancesToEyeWidth) {
  const auto ear = EarEstimator::ComputeEAR(MakeEye(6.0, 1.5));
  ASSERT_TRUE(ear.has_value());
  EXPECT_DOUBLE_EQ(*ear, 0.5);
}

TEST(EarEstimatorTest, ClosedEyeApproachesZero) {
  const auto closed = EarEstimator::ComputeEAR(MakeEye(6.0, 0.0));
  ASSERT_TRUE(closed.has_value());
  EXPECT_DOUBLE_EQ(*closed, 0.0);

  const auto nearly_closed = EarEstimator::ComputeEAR(MakeEye(6.0, 0.01));
  const auto open = EarEstimator::ComputeEAR(MakeEye(6.0, 1.5));
  ASSERT_TRUE(nearly_closed && open);
  EXPECT_LT(*nearly_closed, 0.01);
  EXPECT_GT(*open, *nearly_closed);
}

TEST(EarEstimatorTest, IsNonNegativeForArbitraryValidEyes) {
  const EyeLandmarks skewed = {{{10, 10}, {3, 40}, {-7, 2}, {55, 31}, {20, -5}, {18, 18}}};
  const EyeLandmarks inverted = MakeEye(30.0, -4.0, 100.0, 50.0);
  for (const auto& eye : {skewed, inverted, MakeEye(1.0, 100.0)}) {
    const auto ear = EarEstimator::ComputeEAR(eye);
    ASSERT_TRUE(ear.has_value());
    EXPECT_GE(*ear, 0.0);
  }
}

TEST(EarEstimatorTest, IsTranslationInvariantAndDeterministic) {
  const auto a = EarEstimator::ComputeEAR(MakeEye(60.0, 9.0, 0.0, 0.0));
  const auto b = EarEstimator::ComputeEAR(MakeEye(60.0, 9.0, 0.0, 0.0));
  const auto moved = EarEstimator::ComputeEAR(MakeEye(60.0, 9.0, 320.0, 240.0));
  ASSERT_TRUE(a && b && moved);
  EXPECT_EQ(*a, *b);
  EXPECT_NEAR(*a, *moved, 1e-12);
  EXPECT_NEAR(*a, 0.3, 1e-12);
}

TEST(EarEstimatorTest, ZeroHorizontalDistanceIsInvalid) {
  EyeLandmarks collapsed;
  collapsed.fill({5.0, 5.0});
  EXPECT_FALSE(EarEstimator::ComputeEAR(collapsed).has_value());

  EyeLandmarks corners_coincide = MakeEye(6.0, 1.5);
  corners_coincide[3] = corners_coincide[0];
  EXPECT_FALSE(EarEstimator::ComputeEAR(corners_coincide).has_value());
}

TEST(EarEstimatorTest, NonFiniteCoordinatesAreInvalid) {
  EyeLandmarks eye = MakeEye(6.0, 1.5);
  eye[2].y = std::numeric_limits<double>::quiet_NaN();
  EXPECT_FALSE(EarEstimator::ComputeEAR(eye).has_value());

  eye = MakeEye(6.0, 1.5);
  eye[3].x = std::numeric_limits<double>::infinity();
  EXPECT_FALSE(EarEstimator::ComputeEAR(eye).has_value());
}

TEST(EarEstimatorTest, FrameScoreIsMeanOfBothEyes) {
  const EarReading reading = EarEstimator::Estimate(MakeEye(6.0, 1.5), MakeEye(6.0, 0.75));
  ASSERT_TRUE(reading.left_ear && reading.right_ear);
  EXPECT_DOUBLE_EQ(*reading.left_ear, 0.5);
  EXPECT_DOUBLE_EQ(*reading.right_ear, 0.25);
  ASSERT_TRUE(reading.sample.IsPresent());
  EXPECT_DOUBLE_EQ(reading.sample.Value(), 0.375);
}

TEST(EarEstimatorTest, FallsBackToTheValidEye) {
  EyeLandmarks invalid;
  invalid.fill({1.0, 1.0});

  const EarReading left_only = EarEstimator::Estimate(MakeEye(6.0, 1.5), invalid);
  EXPECT_FALSE(left_only.right_ear.has_value());
  ASSERT_TRUE(left_only.sample.IsPresent());
  EXPECT_DOUBLE_EQ(left_only.sample.Value(), 0.5);

  const EarReading right_only = EarEstimator::Estimate(invalid, MakeEye(6.0, 0.75));
  EXPECT_FALSE(right_only.left_ear.has_value());
  ASSERT_TRUE(right_only.sample.IsPresent());
  EXPECT_DOUBLE_EQ(right_only.sample.Value(), 0.25);
}

TEST(EarEstimatorTest, BothEyesInvalidIsAbsent) {
  EyeLandmarks invalid;
  invalid.fill({1.0, 1.0});
  const EarReading reading = EarEstimator::Estimate(invalid, invalid);
  EXPECT_FALSE(reading.left_ear.has_value());
  EXPECT_FALSE(reading.right_ear.has_value());
  EXPECT_FALSE(reading.sample.IsPresent());
}

TEST(EarEstimatorTest, NoFaceIsAbsent) {
  const EarReading reading = EarEstimator::Estimate(std::optional<FaceLandmarks>{});
  EXPECT_FALSE(reading.sample.IsPresent());

  FaceLandmarks face{MakeEye(6.0, 1.5), MakeEye(6.0, 1.5)};
  const EarReading with_face = EarEstimator::Estimate(std::optional<FaceLandmarks>(face));
  ASSERT_TRUE(with_face.sample.IsPresent());
  EXPECT_DOUBLE_EQ(with_face.sample.Value(), 0.5);
}

}  // namespace
}  // namespace dg::client
