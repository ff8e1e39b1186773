#include "client/FrameEvent.h"

namespace dg::client {

namespace {

Json::Value OptionalEar(const std::optional<double>& ear) {
  if (!ear) return Json::Value(Json::nullValue);
  return Json::Value(*ear);
}

}  // namespace

Json::Value ToJson(const FrameResult& result, const PresentationConfig& presentation) {
  Json::Value payload;
  if (result.alert_raised) {
    payload["type"] = "alert";
  } else if (result.alert_cleared) {
    payload["type"] = "clear";
  } else {
    payload["type"] = "frame";
  }
  payload["frame"] = Json::Int64(result.frame_index);
  payload["face"] = result.face_found;
  payload["state"] = ToString(result.state.State());
  payload["alert_active"] = result.state.alert_active;
  payload["consecutive_low_frames"] = Json::Int64(result.state.consecutive_low_frames);
  payload["alert_raised"] = result.alert_raised;
  payload["alerts_total"] = Json::Int64(result.alerts_total);

  if (presentation.show_ear) {
    payload["ear"] = OptionalEar(result.reading.sample.AsOptional());
    payload["left_ear"] = OptionalEar(result.reading.left_ear);
    payload["right_ear"] = OptionalEar(result.reading.right_ear);
  }
  if (result.alert_raised && presentation.use_sound_alert) {
    payload["sound_cue"] = presentation.sound_file;
  }
  return payload;
}

std::string ToJsonString(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

}  // namespace dg::client
