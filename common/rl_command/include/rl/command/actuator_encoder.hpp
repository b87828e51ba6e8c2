// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <memory>
#include <string>

#include <rl/messages/control_frame.hpp>

namespace rl {

//! Differential-drive mix of a throttle and steering value in [-1, 1].
//! Throttle is scaled by `max_duty`; steering is applied proportionally to the
//! scaled throttle (no turning on the spot). Duties are clamped to
//! [-max_duty, max_duty] and rounded to 3 decimals.
ActuatorCommand mixDifferentialDrive(real_t throttle, real_t steering, real_t max_duty);

//! Throttle from left_y, steering from right_x.
ActuatorCommand mixControlFrame(const ControlFrame& frame, real_t max_duty);

//! Converts actuator commands into the wire format of the motor controller.
class ActuatorEncoder
{
public:
  using Ptr = std::shared_ptr<ActuatorEncoder>;

  virtual ~ActuatorEncoder() = default;

  virtual std::string encode(const ActuatorCommand& cmd) const = 0;
  virtual std::string name() const = 0;
};

//! One compact JSON object per line: {"L":<left>,"R":<right>,"T":1}\n.
//! T=1 selects wheel speed control on the rover firmware.
class JsonLineEncoder : public ActuatorEncoder
{
public:
  static constexpr int kMotorCommandType = 1;

  std::string encode(const ActuatorCommand& cmd) const override;
  std::string name() const override { return "json_line"; }
};

bool isKnownActuatorProtocol(const std::string& protocol);

//! Returns nullptr for an unknown protocol name.
ActuatorEncoder::Ptr makeActuatorEncoder(const std::string& protocol);

} // namespace rl
