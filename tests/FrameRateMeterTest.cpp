#include "client/FrameRateMeter.h"

#include <gtest/gtest.h>

namespace dg::client {
namespace {

using std::chrono::milliseconds;

TEST(FrameRateMeterTest, ReportsNothingDuringTheFirstSecond) {
  FrameRateMeter meter;
  const auto t0 = FrameRateMeter::Clock::time_point{};
  for (int i = 0; i <= 10; ++i) {
    EXPECT_FALSE(meter.Tick(t0 + milliseconds(100 * i)));
  }
  EXPECT_DOUBLE_EQ(meter.Fps(), 0.0);
}

TEST(FrameRateMeterTest, ComputesRateOverTheElapsedWindow) {
  FrameRateMeter meter;
  const auto t0 = FrameRateMeter::Clock::time_point{};
  for (int i = 0; i <= 10; ++i) {
    meter.Tick(t0 + milliseconds(100 * i));
  }
  EXPECT_TRUE(meter.Tick(t0 + milliseconds(1100)));
  EXPECT_NEAR(meter.Fps(), 12.0 / 1.1, 1e-9);

  // The next window starts at the reporting tick.
  for (int i = 1; i <= 20; ++i) {
    meter.Tick(t0 + milliseconds(1100 + 50 * i));
  }
  EXPECT_TRUE(meter.Tick(t0 + milliseconds(1100 + 1050)));
  EXPECT_NEAR(meter.Fps(), 21.0 / 1.05, 1e-9);
}

}  // namespace
}  // namespace dg::client
