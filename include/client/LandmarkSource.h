#pragma once

#include <vector>

#include <opencv2/core.hpp>

namespace dg::client {

// Supplies one face shape per frame tick. Camera capture and landmark
// prediction live behind this interface.
class LandmarkSource {
 public:
  virtual ~LandmarkSource() = default;

  // Returns false once the source is exhausted. An empty shape means no face
  // was found on this frame.
  virtual bool NextFrame(std::vector<cv::Point2d>& shape) = 0;
};

}  // namespace dg::client
