// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <string>

#include <rl/common/types.hpp>
#include <rl/messages/control_frame.hpp>

namespace rl {

//! A data message as delivered by the room transport.
struct DataMessage
{
  std::string topic;
  std::string origin;
  std::string payload;
  TimestampNs arrival_ns = 0;
};

enum class ControlMessageType
{
  Gamepad,
  Handover,
  Maneuver
};

//! Decoded inbound control-plane message. Only the member matching `type` is
//! meaningful.
struct ControlMessage
{
  ControlMessageType type = ControlMessageType::Gamepad;
  //! Identity of the sender.
  std::string origin;
  ControlFrame frame;
  //! Handover target; empty releases the controller latch.
  std::string handover_to;
  ManeuverRequest maneuver;
};

enum class ControlParseResult
{
  Parsed,
  //! Well-formed JSON with a "type" this build does not handle.
  UnknownType,
  Malformed
};

//! Decodes a control-plane payload:
//!   {"type":"gamepad","data":{"left_x":..,"left_y":..,"right_x":..,"right_y":..},
//!    "timestamp":<ms>[,"seq":<n>]}
//!   {"type":"handover","data":{"to":"<identity>"}}
//!   {"type":"forward"|"backward",...} as for parseManeuverMessage()
//! The sequence number is "seq" when present, otherwise "timestamp".
//! Axis ranges are not checked here.
ControlParseResult parseControlMessage(const DataMessage& msg, ControlMessage* out);

//! Decodes a command-topic payload:
//!   {"type":"forward"|"backward","distance":m,"velocity":m/s,"steering":s}
//! Value ranges are not checked here.
ControlParseResult parseManeuverMessage(const DataMessage& msg, ManeuverRequest* out);

} // namespace rl
