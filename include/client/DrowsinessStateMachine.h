#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "client/DetectorConfig.h"
#include "client/EyeTypes.h"

namespace dg::client {

enum class DrowsinessState {
  kAwake,
  kDrowsy,
};

struct DetectionState {
  std::int64_t consecutive_low_frames = 0;
  bool alert_active = false;

  DrowsinessState State() const {
    return alert_active ? DrowsinessState::kDrowsy : DrowsinessState::kAwake;
  }
};

// Pure transition. Never fails; an absent sample clears the run and the alert,
// and only a low-EAR sample can raise it.
DetectionState Transition(const DetectorConfig& config, const DetectionState& state,
                          const EarSample& sample);

class DrowsinessStateMachine {
 public:
  // Empty when the config fails ValidateDetectorConfig; the reason is logged
  // and, if requested, stored in `error`.
  static std::optional<DrowsinessStateMachine> Create(const DetectorConfig& config,
                                                      std::string* error = nullptr);

  const DetectionState& Update(const EarSample& sample);
  void Reset();

  const DetectionState& GetState() const { return state_; }
  bool IsDrowsy() const { return state_.alert_active; }
  const DetectorConfig& GetConfig() const { return config_; }

 private:
  explicit DrowsinessStateMachine(const DetectorConfig& config);

  const DetectorConfig config_;
  DetectionState state_;
};

const char* ToString(DrowsinessState state);

}  // namespace dg::client
