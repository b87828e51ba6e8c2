// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/messages/control_message.hpp>

#include <memory>

#include <json/json.h>

namespace rl {

namespace {

constexpr const char* kAxisKeys[4] = {"left_x", "left_y", "right_x", "right_y"};

bool parse_json(const std::string& payload, Json::Value* root)
{
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errors;
  const char* begin = payload.data();
  const char* end = begin + payload.size();
  if (!reader->parse(begin, end, root, &errors))
  {
    return false;
  }
  return root->isObject();
}

bool read_number(const Json::Value& obj, const char* key, real_t* out)
{
  const Json::Value& v = obj[key];
  if (!v.isNumeric())
  {
    return false;
  }
  *out = static_cast<real_t>(v.asDouble());
  return true;
}

bool read_sequence(const Json::Value& root, uint64_t* seq_out, int64_t* timestamp_out)
{
  const Json::Value& ts = root["timestamp"];
  const bool has_ts = ts.isInt64() && ts.asInt64() >= 0;
  if (has_ts)
  {
    *timestamp_out = ts.asInt64();
  }
  const Json::Value& seq = root["seq"];
  if (seq.isIntegral() && seq.isUInt64())
  {
    *seq_out = seq.asUInt64();
    return true;
  }
  if (!seq.isNull())
  {
    return false;
  }
  if (!has_ts)
  {
    return false;
  }
  *seq_out = static_cast<uint64_t>(ts.asInt64());
  return true;
}

ControlParseResult parse_gamepad(const Json::Value& root,
                                 const DataMessage& msg,
                                 ControlMessage* out)
{
  const Json::Value& data = root["data"];
  if (!data.isObject())
  {
    return ControlParseResult::Malformed;
  }

  ControlFrame frame;
  for (int i = 0; i < 4; ++i)
  {
    real_t value = 0.0;
    if (!read_number(data, kAxisKeys[i], &value))
    {
      return ControlParseResult::Malformed;
    }
    frame.axes(i) = value;
  }
  if (!read_sequence(root, &frame.seq, &frame.sender_timestamp_ms))
  {
    return ControlParseResult::Malformed;
  }
  frame.origin = msg.origin;
  frame.arrival_ns = msg.arrival_ns;

  out->type = ControlMessageType::Gamepad;
  out->frame = std::move(frame);
  return ControlParseResult::Parsed;
}

ControlParseResult parse_handover(const Json::Value& root, ControlMessage* out)
{
  const Json::Value& data = root["data"];
  if (!data.isObject())
  {
    return ControlParseResult::Malformed;
  }
  const Json::Value& to = data["to"];
  if (!to.isNull() && !to.isString())
  {
    return ControlParseResult::Malformed;
  }
  out->type = ControlMessageType::Handover;
  out->handover_to = to.isString() ? to.asString() : std::string();
  return ControlParseResult::Parsed;
}

} // namespace

ControlParseResult parseControlMessage(const DataMessage& msg, ControlMessage* out)
{
  Json::Value root;
  if (!parse_json(msg.payload, &root))
  {
    return ControlParseResult::Malformed;
  }
  const Json::Value& type = root["type"];
  if (!type.isString())
  {
    return ControlParseResult::Malformed;
  }

  ControlMessage parsed;
  ControlParseResult result = ControlParseResult::UnknownType;
  const std::string type_name = type.asString();
  if (type_name == "gamepad")
  {
    result = parse_gamepad(root, msg, &parsed);
  }
  else if (type_name == "handover")
  {
    result = parse_handover(root, &parsed);
  }
  else if (type_name == "forward" || type_name == "backward")
  {
    parsed.type = ControlMessageType::Maneuver;
    result = parseManeuverMessage(msg, &parsed.maneuver);
  }

  if (result == ControlParseResult::Parsed && out)
  {
    parsed.origin = msg.origin;
    *out = std::move(parsed);
  }
  return result;
}

ControlParseResult parseManeuverMessage(const DataMessage& msg, ManeuverRequest* out)
{
  Json::Value root;
  if (!parse_json(msg.payload, &root))
  {
    return ControlParseResult::Malformed;
  }
  const Json::Value& type = root["type"];
  if (!type.isString())
  {
    return ControlParseResult::Malformed;
  }

  ManeuverRequest req;
  const std::string type_name = type.asString();
  if (type_name == "forward")
  {
    req.direction = ManeuverDirection::Forward;
  }
  else if (type_name == "backward")
  {
    req.direction = ManeuverDirection::Backward;
  }
  else
  {
    return ControlParseResult::UnknownType;
  }

  if (!read_number(root, "distance", &req.distance_m) ||
      !read_number(root, "velocity", &req.velocity_mps))
  {
    return ControlParseResult::Malformed;
  }
  if (root.isMember("steering") && !read_number(root, "steering", &req.steering))
  {
    return ControlParseResult::Malformed;
  }
  req.origin = msg.origin;
  req.arrival_ns = msg.arrival_ns;

  if (out)
  {
    *out = std::move(req);
  }
  return ControlParseResult::Parsed;
}

} // namespace rl
