#include "client/DetectorConfig.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace dg::client {

namespace {

bool ParseDouble(const std::string& text, double& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const double value = std::strtod(text.c_str(), &end);
  if (errno != 0 || end != text.c_str() + text.size()) return false;
  out = value;
  return true;
}

bool ParseInt(const std::string& text, int& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end != text.c_str() + text.size()) return false;
  if (value < std::numeric_limits<int>::min() ||
      value > std::numeric_limits<int>::max()) {
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

bool ParseBool(const std::string& text, bool& out) {
  if (text == "1" || text == "true" || text == "yes" || text == "on") {
    out = true;
    return true;
  }
  if (text == "0" || text == "false" || text == "no" || text == "off") {
    out = false;
    return true;
  }
  return false;
}

ConfigLoadResult Fail(ConfigLoadResult result, const std::string& message) {
  result.success = false;
  result.error_message = message;
  return result;
}

}  // namespace

std::string ValidateDetectorConfig(const DetectorConfig& config) {
  if (!std::isfinite(config.ear_threshold)) {
    return "ear_threshold must be a finite number";
  }
  if (config.ear_consecutive_frames <= 0) {
    return "ear_consecutive_frames must be positive, got " +
           std::to_string(config.ear_consecutive_frames);
  }
  return "";
}

ConfigLoadResult LoadClientConfig(const EnvLookup& env) {
  ConfigLoadResult result;
  ClientConfig& cfg = result.config;

  if (const char* v = env("DG_EAR_THRESHOLD")) {
    if (!ParseDouble(v, cfg.detector.ear_threshold)) {
      return Fail(result, std::string("DG_EAR_THRESHOLD is not a number: '") + v + "'");
    }
  }
  if (const char* v = env("DG_EAR_FRAMES")) {
    if (!ParseInt(v, cfg.detector.ear_consecutive_frames)) {
      return Fail(result, std::string("DG_EAR_FRAMES is not an integer: '") + v + "'");
    }
  }
  if (const char* v = env("DG_SHOW_EAR")) {
    if (!ParseBool(v, cfg.presentation.show_ear)) {
      return Fail(result, std::string("DG_SHOW_EAR is not a boolean: '") + v + "'");
    }
  }
  if (const char* v = env("DG_SHOW_FPS")) {
    if (!ParseBool(v, cfg.presentation.show_fps)) {
      return Fail(result, std::string("DG_SHOW_FPS is not a boolean: '") + v + "'");
    }
  }
  if (const char* v = env("DG_USE_SOUND_ALERT")) {
    if (!ParseBool(v, cfg.presentation.use_sound_alert)) {
      return Fail(result, std::string("DG_USE_SOUND_ALERT is not a boolean: '") + v + "'");
    }
  }
  if (const char* v = env("DG_SOUND_FILE")) cfg.presentation.sound_file = v;
  if (const char* v = env("DG_MONITOR_ADDRESS")) cfg.monitor_address = v;

  const std::string error = ValidateDetectorConfig(cfg.detector);
  if (!error.empty()) {
    return Fail(result, error);
  }
  result.success = true;
  return result;
}

ConfigLoadResult LoadClientConfig() {
  return LoadClientConfig([](const char* name) -> const char* { return std::getenv(name); });
}

}  // namespace dg::client
