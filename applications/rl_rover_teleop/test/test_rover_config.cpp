#include <rl/common/test_entrypoint.hpp>
#include <rl/common/time.hpp>
#include <rl/rover_teleop/rover_config.hpp>
#include <rl/rover_teleop/rover_teleop.hpp>

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

namespace rl {

namespace {

RoverConfig benchConfig()
{
  RoverConfig config;
  config.transport = "bench";
  config.room_url = "udp://127.0.0.1:7880";
  config.room_token = "secret";
  config.room_name = "garage";
  return config;
}

RoverConfig liveKitConfig()
{
  RoverConfig config;
  config.room_url = "wss://rover.example.org";
  config.room_token = "secret";
  config.room_name = "garage";
  return config;
}

class CountingLink : public ActuatorLink
{
public:
  bool write(const std::string& bytes) override
  {
    lines.push_back(bytes);
    return true;
  }
  std::string describe() const override { return "counting"; }

  std::vector<std::string> lines;
};

ControlMessage control(const std::string& origin, const std::string& payload)
{
  DataMessage msg;
  msg.topic = "controls";
  msg.origin = origin;
  msg.payload = payload;
  msg.arrival_ns = millisToNanos(1);
  ControlMessage parsed;
  EXPECT_EQ(parseControlMessage(msg, &parsed), ControlParseResult::Parsed) << payload;
  return parsed;
}

} // namespace

TEST(RoverConfigTest, EnvironmentFillsEmptyFlags)
{
  ::setenv("RL_TEST_FALLBACK", "from-env", 1);
  EXPECT_EQ(flagOrEnv("", "RL_TEST_FALLBACK"), "from-env");
  EXPECT_EQ(flagOrEnv("from-flag", "RL_TEST_FALLBACK"), "from-flag");
  ::unsetenv("RL_TEST_FALLBACK");
  EXPECT_EQ(flagOrEnv("", "RL_TEST_FALLBACK"), "");
}

TEST(RoverConfigTest, LoadsDeploymentEnvironment)
{
  FLAGS_room_url = "";
  FLAGS_room_token = "";
  FLAGS_room_name = "lab";
  FLAGS_actuator_port = "";
  ::setenv("LIVEKIT_URL", "udp://127.0.0.1:9000", 1);
  ::setenv("LIVEKIT_TOKEN", "tok", 1);
  ::setenv("ROOM_NAME", "ignored", 1);
  ::setenv("ROVER_PORT", "/dev/ttyACM3", 1);

  const RoverConfig config = loadRoverConfigFromGflags();
  EXPECT_EQ(config.room_url, "udp://127.0.0.1:9000");
  EXPECT_EQ(config.room_token, "tok");
  EXPECT_EQ(config.room_name, "lab");
  EXPECT_EQ(config.actuator_port, "/dev/ttyACM3");
  EXPECT_EQ(config.actuator_baud, 115200);
  EXPECT_EQ(config.watchdog_ms, 300);

  ::unsetenv("ROVER_PORT");
  EXPECT_EQ(loadRoverConfigFromGflags().actuator_port, "/dev/ttyUSB0");

  ::unsetenv("LIVEKIT_URL");
  ::unsetenv("LIVEKIT_TOKEN");
  ::unsetenv("ROOM_NAME");
  FLAGS_room_name = "";
}

TEST(RoverConfigTest, ValidationNamesTheProblem)
{
  std::string error;
  EXPECT_TRUE(validateRoverConfig(benchConfig(), &error)) << error;

  RoverConfig config = benchConfig();
  config.room_token.clear();
  EXPECT_FALSE(validateRoverConfig(config, &error));
  EXPECT_NE(error.find("LIVEKIT_TOKEN"), std::string::npos);

  config = benchConfig();
  config.room_url = "wss://example.invalid";
  EXPECT_FALSE(validateRoverConfig(config, &error));
  EXPECT_NE(error.find("udp://"), std::string::npos);

  config = benchConfig();
  config.video_width = 641;
  EXPECT_FALSE(validateRoverConfig(config, &error));

  config = benchConfig();
  config.transport = "sdk";
  EXPECT_FALSE(validateRoverConfig(config, &error));

  config = benchConfig();
  config.actuator_protocol = "binary";
  EXPECT_FALSE(validateRoverConfig(config, &error));

  config = benchConfig();
  config.actuator_baud = 12345;
  EXPECT_FALSE(validateRoverConfig(config, &error));

  config = benchConfig();
  config.max_duty = 1.5;
  EXPECT_FALSE(validateRoverConfig(config, &error));
  config.max_duty = 1.0;
  EXPECT_TRUE(validateRoverConfig(config, &error)) << error;

  config = benchConfig();
  config.reconnect_base_ms = 60000;
  EXPECT_FALSE(validateRoverConfig(config, &error));
  EXPECT_NE(error.find("reconnect"), std::string::npos);

  config = benchConfig();
  config.watchdog_ms = 0;
  EXPECT_FALSE(validateRoverConfig(config, &error));
}

TEST(RoverConfigTest, LiveKitIsTheDefaultTransport)
{
  const RoverConfig defaults;
  EXPECT_EQ(defaults.transport, "livekit");
  EXPECT_EQ(defaults.local_identity, kRoverCamIdentity);

  std::string error;
  EXPECT_TRUE(validateRoverConfig(liveKitConfig(), &error)) << error;

  RoverConfig config = liveKitConfig();
  config.room_url = "ws://10.0.0.2:7880";
  EXPECT_TRUE(validateRoverConfig(config, &error)) << error;

  config.room_url = "udp://127.0.0.1:7880";
  EXPECT_FALSE(validateRoverConfig(config, &error));
  EXPECT_NE(error.find("ws://"), std::string::npos);

  config.room_url = "https://rover.example.org";
  EXPECT_FALSE(validateRoverConfig(config, &error));
  config.room_url = "wss://";
  EXPECT_FALSE(validateRoverConfig(config, &error));

  config = liveKitConfig();
  config.transport = "sdk";
  EXPECT_FALSE(validateRoverConfig(config, &error));
  EXPECT_NE(error.find("livekit or bench"), std::string::npos);
}

TEST(RoverConfigTest, RoomServerUrls)
{
  EXPECT_TRUE(isRoomServerUrl("wss://rover.example.org"));
  EXPECT_TRUE(isRoomServerUrl("ws://127.0.0.1:7880"));
  EXPECT_FALSE(isRoomServerUrl("ws:///path"));
  EXPECT_FALSE(isRoomServerUrl("http://127.0.0.1:7880"));
  EXPECT_FALSE(isRoomServerUrl(""));
}

TEST(RoverConfigTest, SubscribeFilter)
{
  RoverConfig config = benchConfig();
  config.subscribe_identity = "dashboard";
  const TrackPredicate filter = makeSubscribeFilter(config);

  TrackAvailable track;
  // Our own camera identity is never subscribed back.
  track.identity = kRoverCamIdentity;
  track.role = "camera";
  EXPECT_FALSE(filter(track));
  track.identity = "dashboard";
  EXPECT_TRUE(filter(track));
  track.identity = "op1";
  track.role = "controller";
  EXPECT_TRUE(filter(track));
  track.role = "viewer";
  EXPECT_FALSE(filter(track));
}

TEST(RoverConfigTest, OptionsFollowConfig)
{
  RoverConfig config = benchConfig();
  config.watchdog_ms = 250;
  config.reconnect_attempts = 2;
  config.uplink_max_failures = 7;
  config.audio_uplink = true;

  EXPECT_EQ(makeCommandRouterOptions(config).watchdog_ms, 250);
  const SessionBridgeOptions bridge = makeSessionBridgeOptions(config);
  EXPECT_EQ(bridge.reconnect_attempts, 2);
  EXPECT_EQ(bridge.request.room, "garage");
  EXPECT_EQ(bridge.request.identity, "rover-cam");
  EXPECT_TRUE(bridge.publish_audio);
  EXPECT_TRUE(static_cast<bool>(bridge.subscribe_filter));
  EXPECT_EQ(makeUplinkRelayOptions(config).max_consecutive_failures, 7);

  EXPECT_TRUE(makeRoomTransport(config) != nullptr);
  config.transport = "sdk";
  EXPECT_TRUE(makeRoomTransport(config) == nullptr);
}

TEST(ControlDispatcherTest, RoutesControlPlaneMessages)
{
  auto link = std::make_shared<CountingLink>();
  CommandRouterOptions options;
  options.log_stats_interval_s = 0;
  CommandRouter router(link, std::make_shared<JsonLineEncoder>(), options);
  router.start(0);
  ControlDispatcher dispatcher(router);

  dispatcher.dispatch(control(
      "op1",
      R"({"type":"gamepad","data":{"left_x":0,"left_y":0.5,"right_x":0,"right_y":0},"timestamp":100})"));
  EXPECT_EQ(router.controller(), "op1");

  dispatcher.dispatch(control(
      "op2",
      R"({"type":"gamepad","data":{"left_x":0,"left_y":0.5,"right_x":0,"right_y":0},"timestamp":200})"));
  EXPECT_EQ(dispatcher.stats().rejected, 1u);

  dispatcher.dispatch(control("op1", R"({"type":"handover","data":{"to":"op2"}})"));
  EXPECT_EQ(router.controller(), "op2");

  dispatcher.dispatch(control("op2", R"({"type":"forward","distance":1.0,"velocity":0.5})"));
  EXPECT_TRUE(router.maneuverActive());
  EXPECT_EQ(dispatcher.stats().dispatched, 4u);
  EXPECT_EQ(dispatcher.stats().rejected, 1u);

  PeerEvent left;
  left.type = PeerEventType::Left;
  left.identity = "op2";
  dispatcher.dispatchPeerEvent(left);
  EXPECT_TRUE(router.controller().empty());
}

TEST(ControlDispatcherTest, RejectedManeuverIsCounted)
{
  auto link = std::make_shared<CountingLink>();
  CommandRouterOptions options;
  options.log_stats_interval_s = 0;
  CommandRouter router(link, std::make_shared<JsonLineEncoder>(), options);
  router.start(0);
  ControlDispatcher dispatcher(router);

  dispatcher.dispatch(control("op1", R"({"type":"forward","distance":1e12,"velocity":1e-9})"));
  EXPECT_FALSE(router.maneuverActive());
  EXPECT_EQ(dispatcher.stats().rejected, 1u);
}

} // namespace rl

RL_UNITTEST_ENTRYPOINT
