// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <string>

#include <rl/common/types.hpp>

namespace rl {

enum class Axis : int
{
  LeftX = 0,
  LeftY = 1,
  RightX = 2,
  RightY = 3
};

//! One joystick sample from a remote operator.
struct ControlFrame
{
  //! Strictly increasing per origin.
  uint64_t seq = 0u;
  //! Identity of the remote peer that produced the frame.
  std::string origin;
  //! left_x, left_y, right_x, right_y; nominally in [-1, 1].
  Vector4 axes = Vector4::Zero();
  //! Local monotonic receive time.
  TimestampNs arrival_ns = 0;
  //! Sender clock, informational only.
  int64_t sender_timestamp_ms = 0;

  inline real_t axis(const Axis a) const { return axes(static_cast<int>(a)); }
  inline real_t leftX() const { return axis(Axis::LeftX); }
  inline real_t leftY() const { return axis(Axis::LeftY); }
  inline real_t rightX() const { return axis(Axis::RightX); }
  inline real_t rightY() const { return axis(Axis::RightY); }
};

enum class ManeuverDirection
{
  Forward,
  Backward
};

//! A timed drive request ("move forward 2 m at 0.5 m/s").
struct ManeuverRequest
{
  ManeuverDirection direction = ManeuverDirection::Forward;
  real_t distance_m = 0.0;
  real_t velocity_mps = 0.0;
  real_t steering = 0.0;
  std::string origin;
  TimestampNs arrival_ns = 0;
};

//! Per-wheel duty cycles sent to the motor controller.
struct ActuatorCommand
{
  //! (left, right)
  Vector2 duty = Vector2::Zero();
  //! Sequence number of the frame this was derived from (0 for synthesized).
  uint64_t source_seq = 0u;

  static ActuatorCommand zero() { return ActuatorCommand(); }

  inline real_t left() const { return duty(0); }
  inline real_t right() const { return duty(1); }
  inline bool isZero() const { return duty.isZero(0.0); }
};

} // namespace rl
