#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "client/LandmarkSource.h"

namespace dg::client {

// Generates 68-point shapes whose eyelids follow a scripted EAR sequence.
// Used by the client self-test and by tests in place of a camera.
class SyntheticLandmarkSource : public LandmarkSource {
 public:
  struct Segment {
    std::optional<double> ear;  // empty: no face on these frames
    int frames = 1;
    bool left_eye_valid = true;  // false: left eye collapses to a point
  };

  // Longest scripted run of one kind, in frames.
  static constexpr int kMaxSelfTestRun = 600;

  explicit SyntheticLandmarkSource(std::vector<Segment> script);

  // Open eyes, a blink, a drowsy stretch, a detector dropout mid-alert, an
  // occluded eye, a second drowsy stretch, then recovery. Closure lengths
  // follow `consecutive_frames`, capped at kMaxSelfTestRun.
  static std::vector<Segment> SelfTestScript(int consecutive_frames);

  bool NextFrame(std::vector<cv::Point2d>& shape) override;

  std::size_t TotalFrames() const;

  // Builds a full face whose eyes both measure `ear`.
  static std::vector<cv::Point2d> MakeFace(double ear, bool left_eye_valid = true);

 private:
  std::vector<Segment> script_;
  std::size_t segment_ = 0;
  int emitted_in_segment_ = 0;
};

}  // namespace dg::client
