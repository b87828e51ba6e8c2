// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/rover_teleop/rover_config.hpp>

#include <cstdlib>
#include <initializer_list>
#include <sstream>

#include <rl/command/actuator_encoder.hpp>
#include <rl/command/serial_actuator_link.hpp>
#include <rl/session/udp_bench_transport.hpp>

DEFINE_string(room_url, "",
              "Room server URL (env LIVEKIT_URL): ws:// or wss://, bench: udp://host:port.");
DEFINE_string(room_token, "", "Room access token (env LIVEKIT_TOKEN).");
DEFINE_string(room_name, "", "Room name (env ROOM_NAME).");
DEFINE_string(local_identity, "rover-cam",
              "Identity of this process in the room; its camera track is published under it.");

DEFINE_string(transport, "livekit", "Room transport: livekit, or bench for loopback testing.");
DEFINE_string(bench_video_dump, "",
              "Bench transport: append published access units to this file (empty disables).");

DEFINE_string(actuator_port, "", "Motor controller serial device (env ROVER_PORT, default /dev/ttyUSB0).");
DEFINE_int32(actuator_baud, 115200, "Motor controller baud rate.");
DEFINE_string(actuator_protocol, "json_line", "Actuator wire protocol: json_line.");

DEFINE_string(video_host, "127.0.0.1", "Host of the local H.264 byte stream.");
DEFINE_int32(video_port, 5004, "TCP port of the local H.264 byte stream.");
DEFINE_int32(video_width, 640, "Width of the published camera track.");
DEFINE_int32(video_height, 480, "Height of the published camera track.");

DEFINE_bool(audio_uplink, false, "Publish the microphone as an audio track.");
DEFINE_string(audio_device, "", "Capture device name substring (empty selects the default input).");

DEFINE_string(control_topic, "controls", "Data topic carrying gamepad and handover messages.");
DEFINE_string(command_topic, "command", "Data topic carrying maneuver commands.");
DEFINE_string(status_topic, "status", "Data topic for outbound status reports.");
DEFINE_string(subscribe_identity, "", "Also subscribe to tracks of this identity.");
DEFINE_string(subscribe_role, "controller", "Subscribe to tracks of peers with this role.");

DEFINE_double(write_rate_hz, 20.0, "Actuator write cadence.");
DEFINE_int64(watchdog_ms, 300, "Stop the rover after this long without valid input.");
DEFINE_bool(clamp_axes, false, "Clamp out-of-range axes instead of rejecting the frame.");
DEFINE_int32(link_down_threshold, 3, "Consecutive write failures reported as actuator link down.");
DEFINE_int64(controller_lease_ms, 0,
             "Release a silent controller after this long (0 = latch until it leaves).");
DEFINE_double(max_duty, 0.5, "Maximum wheel duty cycle, in (0, 1].");
DEFINE_double(max_speed_mps, 1.0, "Maneuver speed mapped to full throttle.");

DEFINE_int64(connect_timeout_ms, 10000, "Room connect timeout.");
DEFINE_int32(reconnect_attempts, 5, "Reconnect attempts before giving up.");
DEFINE_int64(reconnect_base_ms, 1000, "Initial reconnect backoff.");
DEFINE_int64(reconnect_cap_ms, 30000, "Maximum reconnect backoff.");

DEFINE_int64(uplink_retry_base_ms, 500, "Initial video source retry backoff.");
DEFINE_int64(uplink_retry_cap_ms, 5000, "Maximum video source retry backoff.");
DEFINE_int32(uplink_max_failures, 5, "Consecutive video source failures reported as source lost.");

DEFINE_int32(log_stats_interval_s, 5, "Seconds between stats logs (0 disables).");

namespace rl {

std::string flagOrEnv(const std::string& flag_value, const char* env_name)
{
  if (!flag_value.empty())
  {
    return flag_value;
  }
  const char* value = std::getenv(env_name);
  return value ? std::string(value) : std::string();
}

RoverConfig loadRoverConfigFromGflags()
{
  RoverConfig config;
  config.room_url = flagOrEnv(FLAGS_room_url, "LIVEKIT_URL");
  config.room_token = flagOrEnv(FLAGS_room_token, "LIVEKIT_TOKEN");
  config.room_name = flagOrEnv(FLAGS_room_name, "ROOM_NAME");
  config.local_identity = FLAGS_local_identity;

  config.transport = FLAGS_transport;
  config.bench_video_dump = FLAGS_bench_video_dump;

  config.actuator_port = flagOrEnv(FLAGS_actuator_port, "ROVER_PORT");
  if (config.actuator_port.empty())
  {
    config.actuator_port = "/dev/ttyUSB0";
  }
  config.actuator_baud = FLAGS_actuator_baud;
  config.actuator_protocol = FLAGS_actuator_protocol;

  config.video_host = FLAGS_video_host;
  config.video_port = FLAGS_video_port;
  config.video_width = FLAGS_video_width;
  config.video_height = FLAGS_video_height;

  config.audio_uplink = FLAGS_audio_uplink;
  config.audio_device = FLAGS_audio_device;

  config.control_topic = FLAGS_control_topic;
  config.command_topic = FLAGS_command_topic;
  config.status_topic = FLAGS_status_topic;
  config.subscribe_identity = FLAGS_subscribe_identity;
  config.subscribe_role = FLAGS_subscribe_role;

  config.write_rate_hz = FLAGS_write_rate_hz;
  config.watchdog_ms = FLAGS_watchdog_ms;
  config.clamp_axes = FLAGS_clamp_axes;
  config.link_down_threshold = FLAGS_link_down_threshold;
  config.controller_lease_ms = FLAGS_controller_lease_ms;
  config.max_duty = FLAGS_max_duty;
  config.max_speed_mps = FLAGS_max_speed_mps;

  config.connect_timeout_ms = FLAGS_connect_timeout_ms;
  config.reconnect_attempts = FLAGS_reconnect_attempts;
  config.reconnect_base_ms = FLAGS_reconnect_base_ms;
  config.reconnect_cap_ms = FLAGS_reconnect_cap_ms;

  config.uplink_retry_base_ms = FLAGS_uplink_retry_base_ms;
  config.uplink_retry_cap_ms = FLAGS_uplink_retry_cap_ms;
  config.uplink_max_failures = FLAGS_uplink_max_failures;

  config.log_stats_interval_s = FLAGS_log_stats_interval_s;
  return config;
}

namespace {

bool startsWith(const std::string& text, const std::string& prefix)
{
  return text.compare(0, prefix.size(), prefix) == 0;
}

bool fail(std::string* error, const std::string& message)
{
  if (error)
  {
    *error = message;
  }
  return false;
}

bool checkBackoff(const char* name, int64_t base_ms, int64_t cap_ms, std::string* error)
{
  if (base_ms <= 0 || cap_ms <= 0)
  {
    std::ostringstream ss;
    ss << name << " backoff must be positive (base " << base_ms << "ms, cap " << cap_ms << "ms)";
    return fail(error, ss.str());
  }
  if (base_ms > cap_ms)
  {
    std::ostringstream ss;
    ss << name << " backoff base " << base_ms << "ms exceeds cap " << cap_ms << "ms";
    return fail(error, ss.str());
  }
  return true;
}

} // namespace

bool isRoomServerUrl(const std::string& url)
{
  for (const char* scheme : {"ws://", "wss://"})
  {
    const std::string prefix(scheme);
    if (startsWith(url, prefix) && url.size() > prefix.size() && url[prefix.size()] != '/')
    {
      return true;
    }
  }
  return false;
}

bool validateRoverConfig(const RoverConfig& config, std::string* error)
{
  if (config.room_url.empty())
  {
    return fail(error, "room URL is required (--room_url or LIVEKIT_URL)");
  }
  if (config.room_token.empty())
  {
    return fail(error, "room token is required (--room_token or LIVEKIT_TOKEN)");
  }
  if (config.room_name.empty())
  {
    return fail(error, "room name is required (--room_name or ROOM_NAME)");
  }
  if (config.local_identity.empty())
  {
    return fail(error, "--local_identity must not be empty");
  }

  if (config.transport == "livekit")
  {
    if (!isRoomServerUrl(config.room_url))
    {
      return fail(error, "livekit transport needs a ws:// or wss:// room URL, got '" +
                  config.room_url + "'");
    }
  }
  else if (config.transport == "bench")
  {
    std::string host;
    int port = 0;
    if (!parseBenchUrl(config.room_url, &host, &port))
    {
      return fail(error, "bench transport needs a udp://host:port room URL, got '" +
                  config.room_url + "'");
    }
  }
  else
  {
    return fail(error, "unknown --transport '" + config.transport + "' (expected livekit or bench)");
  }

  if (config.actuator_port.empty())
  {
    return fail(error, "--actuator_port must not be empty");
  }
  if (!isSupportedBaudRate(config.actuator_baud))
  {
    return fail(error, "unsupported --actuator_baud " + std::to_string(config.actuator_baud));
  }
  if (!isKnownActuatorProtocol(config.actuator_protocol))
  {
    return fail(error, "unknown --actuator_protocol '" + config.actuator_protocol +
                "' (expected json_line)");
  }

  if (config.video_host.empty() || config.video_port <= 0 || config.video_port > 65535)
  {
    return fail(error, "invalid video endpoint " + config.video_host + ":" +
                std::to_string(config.video_port));
  }
  if (config.video_width <= 0 || config.video_height <= 0 ||
      config.video_width % 2 != 0 || config.video_height % 2 != 0)
  {
    return fail(error, "video size must be positive and even, got " +
                std::to_string(config.video_width) + "x" + std::to_string(config.video_height));
  }
  if (config.control_topic.empty() || config.command_topic.empty() ||
      config.status_topic.empty())
  {
    return fail(error, "data topics must not be empty");
  }

  if (!(config.write_rate_hz > 0.0))
  {
    return fail(error, "--write_rate_hz must be positive");
  }
  if (config.watchdog_ms <= 0)
  {
    return fail(error, "--watchdog_ms must be positive");
  }
  if (config.link_down_threshold <= 0)
  {
    return fail(error, "--link_down_threshold must be positive");
  }
  if (config.controller_lease_ms < 0)
  {
    return fail(error, "--controller_lease_ms must not be negative");
  }
  if (!(config.max_duty > 0.0 && config.max_duty <= 1.0))
  {
    return fail(error, "--max_duty must be in (0, 1]");
  }
  if (!(config.max_speed_mps > 0.0))
  {
    return fail(error, "--max_speed_mps must be positive");
  }

  if (config.connect_timeout_ms <= 0)
  {
    return fail(error, "--connect_timeout_ms must be positive");
  }
  if (config.reconnect_attempts < 0)
  {
    return fail(error, "--reconnect_attempts must not be negative");
  }
  if (!checkBackoff("reconnect", config.reconnect_base_ms, config.reconnect_cap_ms, error))
  {
    return false;
  }
  if (!checkBackoff("uplink", config.uplink_retry_base_ms, config.uplink_retry_cap_ms, error))
  {
    return false;
  }
  if (config.uplink_max_failures <= 0)
  {
    return fail(error, "--uplink_max_failures must be positive");
  }
  if (config.log_stats_interval_s < 0)
  {
    return fail(error, "--log_stats_interval_s must not be negative");
  }
  return true;
}

} // namespace rl
