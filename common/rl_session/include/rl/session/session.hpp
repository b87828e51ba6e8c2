// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <map>
#include <string>
#include <vector>

#include <rl/session/event_streams.hpp>
#include <rl/session/room_transport.hpp>

namespace rl {

enum class SessionState
{
  Disconnected,
  Connecting,
  Connected,
  Reconnecting
};

const char* sessionStateName(SessionState state);

struct RemoteTrack
{
  TrackHandle handle;
  TrackInfo info;
  bool subscribed = false;
};

struct RemotePeer
{
  std::string identity;
  std::string role;
  //! Keyed by track sid.
  std::map<std::string, RemoteTrack> tracks;
};

//! One joined room. Never patched across a reconnect: the bridge builds a new
//! Session from the transport's fresh peer list, with the next generation, so
//! handles issued by the previous one are no longer current.
class Session
{
public:
  Session(uint32_t generation, const std::string& local_identity);

  uint32_t generation() const { return generation_; }
  const std::string& localIdentity() const { return local_identity_; }

  //! Replaces an existing peer of the same identity. The local identity is
  //! never added. Returns nullptr if skipped.
  RemotePeer* addPeer(const PeerInfo& info);
  bool removePeer(const std::string& identity);

  RemotePeer* findPeer(const std::string& identity);
  const RemotePeer* findPeer(const std::string& identity) const;

  //! Returns an invalid handle if the peer is unknown.
  TrackHandle addTrack(const std::string& identity, const TrackInfo& info);
  bool removeTrack(const std::string& identity, const std::string& sid);

  //! True if `handle` belongs to this session and the track still exists.
  bool hasTrack(TrackHandle handle) const;

  const std::map<std::string, RemotePeer>& peers() const { return peers_; }
  std::vector<std::string> peerIdentities() const;

private:
  const uint32_t generation_;
  const std::string local_identity_;
  std::map<std::string, RemotePeer> peers_;
  uint32_t next_track_slot_ = 1u;
};

} // namespace rl
