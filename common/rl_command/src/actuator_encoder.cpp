// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/command/actuator_encoder.hpp>

#include <algorithm>
#include <cmath>

#include <json/json.h>

#include <rl/common/logging.hpp>

namespace rl {

namespace {

real_t roundMilli(const real_t v)
{
  // + 0.0 turns -0.0 into 0.0.
  return std::round(v * 1000.0) / 1000.0 + 0.0;
}

} // namespace

constexpr int JsonLineEncoder::kMotorCommandType;

ActuatorCommand mixDifferentialDrive(const real_t throttle,
                                     const real_t steering,
                                     const real_t max_duty)
{
  RL_DEBUG_CHECK(max_duty > 0.0);
  // Throttle is quantized before mixing, like the duties after it.
  const real_t t = roundMilli(throttle * max_duty);
  const real_t s = steering;
  real_t left = 0.0;
  real_t right = 0.0;
  if (t > 0.0)
  {
    left = t + s * std::abs(t);
    right = t - s * std::abs(t);
  }
  else
  {
    left = t - s * std::abs(t);
    right = t + s * std::abs(t);
  }
  ActuatorCommand cmd;
  cmd.duty(0) = roundMilli(std::max(-max_duty, std::min(max_duty, left)));
  cmd.duty(1) = roundMilli(std::max(-max_duty, std::min(max_duty, right)));
  return cmd;
}

ActuatorCommand mixControlFrame(const ControlFrame& frame, const real_t max_duty)
{
  ActuatorCommand cmd = mixDifferentialDrive(frame.leftY(), frame.rightX(), max_duty);
  cmd.source_seq = frame.seq;
  return cmd;
}

std::string JsonLineEncoder::encode(const ActuatorCommand& cmd) const
{
  Json::Value root(Json::objectValue);
  root["T"] = kMotorCommandType;
  root["L"] = cmd.left();
  root["R"] = cmd.right();

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["precision"] = 3;
  builder["precisionType"] = "decimal";
  return Json::writeString(builder, root) + "\n";
}

bool isKnownActuatorProtocol(const std::string& protocol)
{
  return protocol == "json_line";
}

ActuatorEncoder::Ptr makeActuatorEncoder(const std::string& protocol)
{
  if (protocol == "json_line")
  {
    return std::make_shared<JsonLineEncoder>();
  }
  LOG(ERROR) << "[Router] Unknown actuator protocol '" << protocol << "'";
  return nullptr;
}

} // namespace rl
