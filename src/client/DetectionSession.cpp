#include "client/DetectionSession.h"

#include <iostream>
#include <utility>

namespace dg::client {

DetectionSession::DetectionSession(DrowsinessStateMachine machine)
    : machine_(std::move(machine)) {
  const DetectorConfig& config = machine_.GetConfig();
  std::cout << "[DetectionSession] Initialized: "
            << "ear_threshold=" << config.ear_threshold << ", "
            << "ear_consecutive_frames=" << config.ear_consecutive_frames << std::endl;
}

std::unique_ptr<DetectionSession> DetectionSession::Create(const DetectorConfig& config,
                                                           std::string* error) {
  auto machine = DrowsinessStateMachine::Create(config, error);
  if (!machine) {
    return nullptr;
  }
  return std::make_unique<DetectionSession>(std::move(*machine));
}

FrameResult DetectionSession::ProcessFace(const std::optional<FaceLandmarks>& face) {
  return Advance(face.has_value(), EarEstimator::Estimate(face));
}

FrameResult DetectionSession::ProcessSample(const EarSample& sample) {
  EarReading reading;
  reading.sample = sample;
  return Advance(sample.IsPresent(), reading);
}

FrameResult DetectionSession::Advance(bool face_found, const EarReading& reading) {
  std::lock_guard<std::mutex> lock(lock_);

  const bool was_active = machine_.IsDrowsy();
  const DetectionState& state = machine_.Update(reading.sample);

  FrameResult result;
  result.frame_index = next_frame_++;
  result.face_found = face_found;
  result.reading = reading;
  result.state = state;
  result.alert_raised = !was_active && state.alert_active;
  result.alert_cleared = was_active && !state.alert_active;

  if (result.alert_raised) {
    alerts_total_++;
    std::cout << "[DetectionSession] Drowsiness detected! Alert #" << alerts_total_
              << " (frame " << result.frame_index << ", "
              << state.consecutive_low_frames << " low frames)" << std::endl;
  } else if (result.alert_cleared) {
    std::cout << "[DetectionSession] Alert cleared at frame " << result.frame_index
              << (reading.sample.IsPresent() ? " (eyes open)" : " (no face)")
              << std::endl;
  }
  result.alerts_total = alerts_total_;

  // Dropouts are logged once when they start and once when they end.
  if (!face_found && !face_lost_) {
    face_lost_ = true;
    std::cout << "[DetectionSession] No face detected (frame " << result.frame_index
              << ")" << std::endl;
  } else if (face_found && face_lost_) {
    face_lost_ = false;
    std::cout << "[DetectionSession] Face reacquired (frame " << result.frame_index
              << ")" << std::endl;
  }

  last_ = result;
  return result;
}

FrameResult DetectionSession::Snapshot() const {
  std::lock_guard<std::mutex> lock(lock_);
  return last_;
}

void DetectionSession::Reset() {
  std::lock_guard<std::mutex> lock(lock_);
  machine_.Reset();
  last_ = FrameResult{};
  next_frame_ = 0;
  alerts_total_ = 0;
  face_lost_ = false;
  std::cout << "[DetectionSession] Session reset" << std::endl;
}

}  // namespace dg::client
