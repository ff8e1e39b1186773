#include "client/DrowsinessStateMachine.h"

#include <iostream>
#include <limits>

namespace dg::client {

DetectionState Transition(const DetectorConfig& config, const DetectionState& state,
                          const EarSample& sample) {
  DetectionState next = state;

  if (!sample.IsPresent()) {
    next.consecutive_low_frames = 0;
    next.alert_active = false;
    return next;
  }

  if (sample.Value() >= config.ear_threshold) {
    next.consecutive_low_frames = 0;
    next.alert_active = false;
    return next;
  }

  if (next.consecutive_low_frames < std::numeric_limits<std::int64_t>::max()) {
    next.consecutive_low_frames++;
  }
  // A shorter run never clears an active alert; only the branches above do.
  if (next.consecutive_low_frames >= config.ear_consecutive_frames) {
    next.alert_active = true;
  }
  return next;
}

std::optional<DrowsinessStateMachine> DrowsinessStateMachine::Create(
    const DetectorConfig& config, std::string* error) {
  const std::string problem = ValidateDetectorConfig(config);
  if (!problem.empty()) {
    std::cerr << "[DrowsinessStateMachine] Invalid config: " << problem << std::endl;
    if (error) *error = problem;
    return std::nullopt;
  }
  return DrowsinessStateMachine(config);
}

DrowsinessStateMachine::DrowsinessStateMachine(const DetectorConfig& config)
    : config_(config) {}

const DetectionState& DrowsinessStateMachine::Update(const EarSample& sample) {
  state_ = Transition(config_, state_, sample);
  return state_;
}

void DrowsinessStateMachine::Reset() {
  state_ = DetectionState{};
}

const char* ToString(DrowsinessState state) {
  switch (state) {
    case DrowsinessState::kAwake:
      return "AWAKE";
    case DrowsinessState::kDrowsy:
      return "DROWSY";
  }
  return "UNKNOWN";
}

}  // namespace dg::client
