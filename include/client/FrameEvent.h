#pragma once

#include <string>

#include <json/json.h>

#include "client/DetectionSession.h"
#include "client/DetectorConfig.h"

namespace dg::client {

// One JSON object per frame for the presentation layer.
Json::Value ToJson(const FrameResult& result, const PresentationConfig& presentation);

// Compact single-line rendering.
std::string ToJsonString(const Json::Value& value);

}  // namespace dg::client
