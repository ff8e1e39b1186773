#include "client/FrameEvent.h"

#include <gtest/gtest.h>

namespace dg::client {
namespace {

FrameResult AlertFrame() {
  FrameResult result;
  result.frame_index = 41;
  result.face_found = true;
  result.reading.left_ear = 0.11;
  result.reading.right_ear = 0.13;
  result.reading.sample = EarSample::Present(0.12);
  result.state.consecutive_low_frames = 20;
  result.state.alert_active = true;
  result.alert_raised = true;
  result.alerts_total = 3;
  return result;
}

TEST(FrameEventTest, EncodesAlertFrame) {
  PresentationConfig presentation;
  const Json::Value json = ToJson(AlertFrame(), presentation);
  EXPECT_EQ(json["type"].asString(), "alert");
  EXPECT_EQ(json["frame"].asInt64(), 41);
  EXPECT_TRUE(json["face"].asBool());
  EXPECT_EQ(json["state"].asString(), "DROWSY");
  EXPECT_TRUE(json["alert_active"].asBool());
  EXPECT_EQ(json["consecutive_low_frames"].asInt64(), 20);
  EXPECT_EQ(json["alerts_total"].asInt64(), 3);
  EXPECT_DOUBLE_EQ(json["ear"].asDouble(), 0.12);
  EXPECT_DOUBLE_EQ(json["left_ear"].asDouble(), 0.11);
  EXPECT_FALSE(json.isMember("sound_cue"));
}

TEST(FrameEventTest, AddsSoundCueOnlyOnAlertRaise) {
  PresentationConfig presentation;
  presentation.use_sound_alert = true;
  presentation.sound_file = "assets/chime.wav";

  FrameResult result = AlertFrame();
  EXPECT_EQ(ToJson(result, presentation)["sound_cue"].asString(), "assets/chime.wav");

  result.alert_raised = false;
  EXPECT_FALSE(ToJson(result, presentation).isMember("sound_cue"));
}

TEST(FrameEventTest, AbsentMeasurementsAreNull) {
  FrameResult result;
  result.frame_index = 7;
  result.alert_cleared = true;
  const Json::Value json = ToJson(result, PresentationConfig{});
  EXPECT_EQ(json["type"].asString(), "clear");
  EXPECT_FALSE(json["face"].asBool());
  EXPECT_TRUE(json["ear"].isNull());
  EXPECT_TRUE(json["right_ear"].isNull());
  EXPECT_EQ(json["state"].asString(), "AWAKE");
}

TEST(FrameEventTest, HidesEarWhenDisabled) {
  PresentationConfig presentation;
  presentation.show_ear = false;
  const Json::Value json = ToJson(AlertFrame(), presentation);
  EXPECT_FALSE(json.isMember("ear"));
  EXPECT_FALSE(json.isMember("left_ear"));
}

TEST(FrameEventTest, RendersOneLine) {
  FrameResult result;
  const std::string text = ToJsonString(ToJson(result, PresentationConfig{}));
  EXPECT_EQ(text.find('\n'), std::string::npos);
  EXPECT_NE(text.find("\"type\":\"frame\""), std::string::npos);
}

}  // namespace
}  // namespace dg::client
