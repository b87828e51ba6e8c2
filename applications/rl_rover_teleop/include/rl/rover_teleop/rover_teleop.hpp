// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <atomic>
#include <cstdint>

#include <rl/command/command_router.hpp>
#include <rl/rover_teleop/rover_config.hpp>
#include <rl/session/room_transport.hpp>
#include <rl/session/session_bridge.hpp>
#include <rl/uplink/uplink_relay.hpp>

namespace rl {

//! Default identity of this process; the rover camera feed is published
//! under it.
constexpr const char* kRoverCamIdentity = "rover-cam";

TrackPredicate makeSubscribeFilter(const RoverConfig& config);
SessionBridgeOptions makeSessionBridgeOptions(const RoverConfig& config);
CommandRouterOptions makeCommandRouterOptions(const RoverConfig& config);
UplinkRelayOptions makeUplinkRelayOptions(const RoverConfig& config);

//! Returns nullptr for an unknown transport name.
RoomTransport::Ptr makeRoomTransport(const RoverConfig& config);

struct ControlDispatcherStats
{
  uint64_t dispatched = 0;
  uint64_t rejected = 0;
};

//! Feeds decoded control-plane messages to the router.
class ControlDispatcher
{
public:
  explicit ControlDispatcher(CommandRouter& router)
    : router_(router)
  {}

  void dispatch(const ControlMessage& msg);
  void dispatchPeerEvent(const PeerEvent& event);

  ControlDispatcherStats stats() const;

private:
  CommandRouter& router_;
  std::atomic<uint64_t> dispatched_{0};
  std::atomic<uint64_t> rejected_{0};
};

} // namespace rl
