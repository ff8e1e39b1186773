#pragma once

#include <functional>
#include <string>

namespace dg::client {

struct DetectorConfig {
  double ear_threshold = 0.25;     // EAR below this counts as a closed-eye frame
  int ear_consecutive_frames = 20;  // closed-eye run length that raises the alert
};

struct PresentationConfig {
  bool show_ear = true;
  bool show_fps = true;
  bool use_sound_alert = false;
  std::string sound_file = "assets/alarm.wav";
};

struct ClientConfig {
  DetectorConfig detector;
  PresentationConfig presentation;
  std::string monitor_address = "localhost:50051";
};

struct ConfigLoadResult {
  ClientConfig config;
  bool success = false;
  std::string error_message;
};

// Returns nullptr when the variable is unset.
using EnvLookup = std::function<const char*(const char*)>;

// Empty string when valid, otherwise a message naming the bad field.
std::string ValidateDetectorConfig(const DetectorConfig& config);

// Defaults overridden by DG_* environment variables. Never substitutes a
// default for a value that is present but invalid.
ConfigLoadResult LoadClientConfig(const EnvLookup& env);
ConfigLoadResult LoadClientConfig();

}  // namespace dg::client
