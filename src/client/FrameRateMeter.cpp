#include "client/FrameRateMeter.h"

namespace dg::client {

FrameRateMeter::FrameRateMeter() = default;

bool FrameRateMeter::Tick(Clock::time_point now) {
  if (!started_) {
    window_start_ = now;
    started_ = true;
  }
  frames_++;

  const std::chrono::duration<double> elapsed = now - window_start_;
  if (elapsed.count() <= 1.0) {
    return false;
  }
  fps_ = frames_ / elapsed.count();
  frames_ = 0;
  window_start_ = now;
  return true;
}

}  // namespace dg::client
