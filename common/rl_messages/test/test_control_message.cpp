// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/common/test_entrypoint.hpp>
#include <rl/messages/control_message.hpp>
#include <rl/messages/status_report.hpp>

namespace {

rl::DataMessage make_message(const std::string& payload)
{
  rl::DataMessage msg;
  msg.topic = "controls";
  msg.origin = "operator-1";
  msg.payload = payload;
  msg.arrival_ns = 777;
  return msg;
}

}  // namespace

TEST(ControlMessage, GamepadUsesTimestampAsSequence)
{
  using namespace rl;

  const DataMessage msg = make_message(
      R"({"type":"gamepad","data":{"left_x":0.5,"left_y":-0.2,"right_x":0.0,"right_y":0.1},"timestamp":1234})");
  ControlMessage out;
  ASSERT_EQ(parseControlMessage(msg, &out), ControlParseResult::Parsed);
  EXPECT_EQ(out.type, ControlMessageType::Gamepad);
  EXPECT_EQ(out.frame.seq, 1234u);
  EXPECT_EQ(out.frame.sender_timestamp_ms, 1234);
  EXPECT_EQ(out.frame.origin, "operator-1");
  EXPECT_EQ(out.frame.arrival_ns, 777);
  EXPECT_DOUBLE_EQ(out.frame.leftX(), 0.5);
  EXPECT_DOUBLE_EQ(out.frame.leftY(), -0.2);
  EXPECT_DOUBLE_EQ(out.frame.rightX(), 0.0);
  EXPECT_DOUBLE_EQ(out.frame.rightY(), 0.1);
}

TEST(ControlMessage, ExplicitSequenceWins)
{
  using namespace rl;

  const DataMessage msg = make_message(
      R"({"type":"gamepad","seq":10,"data":{"left_x":0,"left_y":1,"right_x":-1,"right_y":0},"timestamp":99999})");
  ControlMessage out;
  ASSERT_EQ(parseControlMessage(msg, &out), ControlParseResult::Parsed);
  EXPECT_EQ(out.frame.seq, 10u);
  EXPECT_DOUBLE_EQ(out.frame.leftY(), 1.0);
  EXPECT_DOUBLE_EQ(out.frame.rightX(), -1.0);
}

TEST(ControlMessage, OutOfRangeAxesStillParse)
{
  using namespace rl;

  const DataMessage msg = make_message(
      R"({"type":"gamepad","data":{"left_x":1.0001,"left_y":0,"right_x":0,"right_y":0},"timestamp":5})");
  ControlMessage out;
  ASSERT_EQ(parseControlMessage(msg, &out), ControlParseResult::Parsed);
  EXPECT_DOUBLE_EQ(out.frame.leftX(), 1.0001);
}

TEST(ControlMessage, MalformedPayloads)
{
  using namespace rl;

  const char* payloads[] = {
    "not json",
    "[1,2,3]",
    R"({"data":{}})",
    R"({"type":"gamepad","data":{"left_x":0,"left_y":0,"right_x":0},"timestamp":1})",
    R"({"type":"gamepad","data":{"left_x":"0","left_y":0,"right_x":0,"right_y":0},"timestamp":1})",
    R"({"type":"gamepad","data":{"left_x":0,"left_y":0,"right_x":0,"right_y":0}})",
    R"({"type":"gamepad","data":{"left_x":0,"left_y":0,"right_x":0,"right_y":0},"timestamp":-4})",
    R"({"type":"gamepad","seq":-1,"data":{"left_x":0,"left_y":0,"right_x":0,"right_y":0},"timestamp":4})",
    R"({"type":"handover","data":{"to":5}})",
  };
  for (const char* payload : payloads)
  {
    ControlMessage out;
    EXPECT_EQ(parseControlMessage(make_message(payload), &out), ControlParseResult::Malformed)
        << payload;
  }
}

TEST(ControlMessage, UnknownTypeIsNotMalformed)
{
  using namespace rl;

  ControlMessage out;
  EXPECT_EQ(parseControlMessage(make_message(R"({"type":"haptics","data":{}})"), &out),
            ControlParseResult::UnknownType);
}

TEST(ControlMessage, Handover)
{
  using namespace rl;

  ControlMessage out;
  ASSERT_EQ(parseControlMessage(
                make_message(R"({"type":"handover","data":{"to":"operator-2"}})"), &out),
            ControlParseResult::Parsed);
  EXPECT_EQ(out.type, ControlMessageType::Handover);
  EXPECT_EQ(out.handover_to, "operator-2");

  ASSERT_EQ(parseControlMessage(make_message(R"({"type":"handover","data":{}})"), &out),
            ControlParseResult::Parsed);
  EXPECT_TRUE(out.handover_to.empty());
}

TEST(ControlMessage, Maneuver)
{
  using namespace rl;

  ManeuverRequest req;
  ASSERT_EQ(parseManeuverMessage(
                make_message(R"({"type":"backward","distance":2,"velocity":0.5,"steering":0.8})"),
                &req),
            ControlParseResult::Parsed);
  EXPECT_EQ(req.direction, ManeuverDirection::Backward);
  EXPECT_DOUBLE_EQ(req.distance_m, 2.0);
  EXPECT_DOUBLE_EQ(req.velocity_mps, 0.5);
  EXPECT_DOUBLE_EQ(req.steering, 0.8);
  EXPECT_EQ(req.origin, "operator-1");

  ASSERT_EQ(parseManeuverMessage(
                make_message(R"({"type":"forward","distance":1,"velocity":1})"), &req),
            ControlParseResult::Parsed);
  EXPECT_DOUBLE_EQ(req.steering, 0.0);

  EXPECT_EQ(parseManeuverMessage(make_message(R"({"type":"spin","distance":1,"velocity":1})"), &req),
            ControlParseResult::UnknownType);
  EXPECT_EQ(parseManeuverMessage(make_message(R"({"type":"forward","distance":1})"), &req),
            ControlParseResult::Malformed);
}

TEST(ControlMessage, ManeuverOnTheControlPlane)
{
  using namespace rl;

  ControlMessage out;
  ASSERT_EQ(parseControlMessage(
                make_message(R"({"type":"forward","distance":1.5,"velocity":0.5})"), &out),
            ControlParseResult::Parsed);
  EXPECT_EQ(out.type, ControlMessageType::Maneuver);
  EXPECT_EQ(out.origin, "operator-1");
  EXPECT_EQ(out.maneuver.direction, ManeuverDirection::Forward);
  EXPECT_DOUBLE_EQ(out.maneuver.distance_m, 1.5);
  EXPECT_EQ(out.maneuver.origin, "operator-1");

  EXPECT_EQ(parseControlMessage(make_message(R"({"type":"backward","velocity":0.5})"), &out),
            ControlParseResult::Malformed);
}

TEST(StatusReport, EncodeDecode)
{
  using namespace rl;

  StatusReport report;
  report.event = "actuator_link_down";
  report.state = "connected";
  report.detail = "3 consecutive write failures";
  report.timestamp_ms = 1700000000000;
  report.counters["write_failures"] = 3u;

  const std::string payload = encodeStatusReport(report);
  EXPECT_EQ(payload.find('\n'), std::string::npos);

  StatusReport decoded;
  ASSERT_TRUE(decodeStatusReport(payload, &decoded));
  EXPECT_EQ(decoded.event, report.event);
  EXPECT_EQ(decoded.state, report.state);
  EXPECT_EQ(decoded.detail, report.detail);
  EXPECT_EQ(decoded.timestamp_ms, report.timestamp_ms);
  EXPECT_EQ(decoded.counters.at("write_failures"), 3u);

  EXPECT_FALSE(decodeStatusReport(R"({"type":"gamepad"})", &decoded));
}

RL_UNITTEST_ENTRYPOINT
