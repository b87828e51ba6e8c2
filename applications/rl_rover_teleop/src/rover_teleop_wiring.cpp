// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/rover_teleop/rover_teleop.hpp>

#include <rl/common/logging.hpp>
#include <rl/session/livekit_room_transport.hpp>
#include <rl/session/udp_bench_transport.hpp>

namespace rl {

TrackPredicate makeSubscribeFilter(const RoverConfig& config)
{
  const std::string identity = config.subscribe_identity;
  const std::string role = config.subscribe_role;
  return [identity, role](const TrackAvailable& track) {
    if (!identity.empty() && track.identity == identity)
    {
      return true;
    }
    return !role.empty() && track.role == role;
  };
}

SessionBridgeOptions makeSessionBridgeOptions(const RoverConfig& config)
{
  SessionBridgeOptions options;
  options.request.url = config.room_url;
  options.request.token = config.room_token;
  options.request.room = config.room_name;
  options.request.identity = config.local_identity;
  options.connect_timeout_ms = config.connect_timeout_ms;
  options.reconnect_attempts = config.reconnect_attempts;
  options.reconnect_base_ms = config.reconnect_base_ms;
  options.reconnect_cap_ms = config.reconnect_cap_ms;
  options.status_topic = config.status_topic;
  options.subscribe_filter = makeSubscribeFilter(config);
  options.publish_audio = config.audio_uplink;
  return options;
}

CommandRouterOptions makeCommandRouterOptions(const RoverConfig& config)
{
  CommandRouterOptions options;
  options.write_rate_hz = config.write_rate_hz;
  options.watchdog_ms = config.watchdog_ms;
  options.clamp_axes = config.clamp_axes;
  options.link_down_threshold = config.link_down_threshold;
  options.controller_lease_ms = config.controller_lease_ms;
  options.max_duty = config.max_duty;
  options.max_speed_mps = config.max_speed_mps;
  options.log_stats_interval_s = config.log_stats_interval_s;
  return options;
}

UplinkRelayOptions makeUplinkRelayOptions(const RoverConfig& config)
{
  UplinkRelayOptions options;
  options.retry_base_ms = config.uplink_retry_base_ms;
  options.retry_cap_ms = config.uplink_retry_cap_ms;
  options.max_consecutive_failures = config.uplink_max_failures;
  options.log_stats_interval_s = config.log_stats_interval_s;
  return options;
}

RoomTransport::Ptr makeRoomTransport(const RoverConfig& config)
{
  LOG(INFO) << "[Teleop] Room transport: " << config.transport;
  if (config.transport == "livekit")
  {
    LiveKitTransportOptions options;
    options.video.width = config.video_width;
    options.video.height = config.video_height;
    return std::make_shared<LiveKitRoomTransport>(options);
  }
  if (config.transport == "bench")
  {
    UdpBenchOptions options;
    if (!parseBenchUrl(config.room_url, &options.host, &options.port))
    {
      LOG(ERROR) << "[Teleop] Invalid bench URL: " << config.room_url;
      return nullptr;
    }
    options.video_dump_path = config.bench_video_dump;
    return std::make_shared<UdpBenchTransport>(options);
  }
  LOG(ERROR) << "[Teleop] Unknown room transport: " << config.transport;
  return nullptr;
}

// -----------------------------------------------------------------------------
// ControlDispatcher.

void ControlDispatcher::dispatch(const ControlMessage& msg)
{
  ++dispatched_;
  switch (msg.type)
  {
  case ControlMessageType::Gamepad:
  {
    const SubmitResult submitted = router_.submit(msg.frame);
    if (submitted != SubmitResult::Accepted)
    {
      ++rejected_;
      VLOG(2) << "[Teleop] Frame " << msg.frame.seq << " from '" << msg.origin << "' "
              << submitResultName(submitted);
    }
    break;
  }
  case ControlMessageType::Handover:
    if (!router_.handover(msg.origin, msg.handover_to))
    {
      ++rejected_;
    }
    break;
  case ControlMessageType::Maneuver:
    if (!router_.submitManeuver(msg.maneuver))
    {
      ++rejected_;
    }
    break;
  }
}

void ControlDispatcher::dispatchPeerEvent(const PeerEvent& event)
{
  if (event.type == PeerEventType::Left)
  {
    router_.onPeerLeft(event.identity);
  }
}

ControlDispatcherStats ControlDispatcher::stats() const
{
  ControlDispatcherStats stats;
  stats.dispatched = dispatched_.load();
  stats.rejected = rejected_.load();
  return stats;
}

} // namespace rl
