#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "client/DetectorConfig.h"
#include "client/DrowsinessStateMachine.h"
#include "client/EarEstimator.h"

namespace dg::client {

struct FrameResult {
  std::int64_t frame_index = 0;
  bool face_found = false;
  EarReading reading;
  DetectionState state;
  bool alert_raised = false;   // alert_active went false -> true on this frame
  bool alert_cleared = false;  // alert_active went true -> false on this frame
  std::int64_t alerts_total = 0;
};

// Drives one detection session frame by frame. Each call runs one transition
// under the session lock; other threads only read copies via Snapshot().
class DetectionSession {
 public:
  explicit DetectionSession(DrowsinessStateMachine machine);

  // Empty when the config is rejected; see DrowsinessStateMachine::Create.
  static std::unique_ptr<DetectionSession> Create(const DetectorConfig& config,
                                                  std::string* error = nullptr);

  FrameResult ProcessFace(const std::optional<FaceLandmarks>& face);
  FrameResult ProcessSample(const EarSample& sample);

  FrameResult Snapshot() const;
  void Reset();

  const DetectorConfig& GetConfig() const { return machine_.GetConfig(); }

 private:
  FrameResult Advance(bool face_found, const EarReading& reading);

  mutable std::mutex lock_;
  DrowsinessStateMachine machine_;
  FrameResult last_;
  std::int64_t next_frame_ = 0;
  std::int64_t alerts_total_ = 0;
  bool face_lost_ = false;
};

}  // namespace dg::client
