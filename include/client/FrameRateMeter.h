#pragma once

#include <chrono>

namespace dg::client {

// Frames per second, recomputed once at least one second has elapsed.
class FrameRateMeter {
 public:
  using Clock = std::chrono::steady_clock;

  FrameRateMeter();

  // Returns true when the reported rate changed.
  bool Tick(Clock::time_point now);
  bool Tick() { return Tick(Clock::now()); }

  double Fps() const { return fps_; }

 private:
  double fps_ = 0.0;
  int frames_ = 0;
  Clock::time_point window_start_;
  bool started_ = false;
};

}  // namespace dg::client
