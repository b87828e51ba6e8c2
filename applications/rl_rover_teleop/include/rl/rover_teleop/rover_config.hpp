// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <string>

#include <rl/common/logging.hpp>
#include <rl/common/types.hpp>

DECLARE_string(room_url);
DECLARE_string(room_token);
DECLARE_string(room_name);
DECLARE_string(local_identity);
DECLARE_string(actuator_port);
DECLARE_int32(actuator_baud);
DECLARE_string(actuator_protocol);
DECLARE_string(transport);
DECLARE_bool(audio_uplink);
DECLARE_string(audio_device);

namespace rl {

//! Process configuration, resolved from gflags with environment fallbacks.
struct RoverConfig
{
  std::string room_url;
  std::string room_token;
  std::string room_name;
  //! The camera track is published under this identity.
  std::string local_identity = "rover-cam";

  //! "livekit", or "bench" for the loopback test transport.
  std::string transport = "livekit";
  std::string bench_video_dump;

  std::string actuator_port = "/dev/ttyUSB0";
  int actuator_baud = 115200;
  std::string actuator_protocol = "json_line";

  std::string video_host = "127.0.0.1";
  int video_port = 5004;
  int video_width = 640;
  int video_height = 480;

  bool audio_uplink = false;
  //! Substring of the capture device name; empty selects the default input.
  std::string audio_device;

  std::string control_topic = "controls";
  std::string command_topic = "command";
  std::string status_topic = "status";
  std::string subscribe_identity;
  std::string subscribe_role = "controller";

  real_t write_rate_hz = 20.0;
  int64_t watchdog_ms = 300;
  bool clamp_axes = false;
  int link_down_threshold = 3;
  int64_t controller_lease_ms = 0;
  real_t max_duty = 0.5;
  real_t max_speed_mps = 1.0;

  int64_t connect_timeout_ms = 10000;
  int reconnect_attempts = 5;
  int64_t reconnect_base_ms = 1000;
  int64_t reconnect_cap_ms = 30000;

  int64_t uplink_retry_base_ms = 500;
  int64_t uplink_retry_cap_ms = 5000;
  int uplink_max_failures = 5;

  int log_stats_interval_s = 5;
};

//! `flag_value` unless empty, otherwise the environment variable (or "").
std::string flagOrEnv(const std::string& flag_value, const char* env_name);

RoverConfig loadRoverConfigFromGflags();

//! True for a ws:// or wss:// URL with a host.
bool isRoomServerUrl(const std::string& url);

//! Returns false and describes the first problem found in `error`.
bool validateRoverConfig(const RoverConfig& config, std::string* error);

} // namespace rl
