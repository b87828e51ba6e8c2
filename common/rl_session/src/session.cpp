// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/session/session.hpp>

#include <rl/common/logging.hpp>

namespace rl {

const char* sessionStateName(const SessionState state)
{
  switch (state)
  {
  case SessionState::Disconnected: return "disconnected";
  case SessionState::Connecting: return "connecting";
  case SessionState::Connected: return "connected";
  case SessionState::Reconnecting: return "reconnecting";
  }
  return "unknown";
}

const char* disconnectReasonName(const DisconnectReason reason)
{
  switch (reason)
  {
  case DisconnectReason::NetworkLoss: return "network_loss";
  case DisconnectReason::ServerRestart: return "server_restart";
  case DisconnectReason::Removed: return "removed";
  case DisconnectReason::AuthExpired: return "auth_expired";
  case DisconnectReason::ClientInitiated: return "client_initiated";
  }
  return "unknown";
}

Session::Session(const uint32_t generation, const std::string& local_identity)
  : generation_(generation)
  , local_identity_(local_identity)
{
  CHECK(TrackHandle(0u, generation).valid()) << "Session generation 0 is reserved.";
}

RemotePeer* Session::addPeer(const PeerInfo& info)
{
  if (info.identity.empty() || info.identity == local_identity_)
  {
    return nullptr;
  }
  RemotePeer peer;
  peer.identity = info.identity;
  peer.role = info.role;
  RemotePeer& stored = peers_[info.identity];
  stored = std::move(peer);
  for (const TrackInfo& track : info.tracks)
  {
    addTrack(info.identity, track);
  }
  return &stored;
}

bool Session::removePeer(const std::string& identity)
{
  return peers_.erase(identity) > 0u;
}

RemotePeer* Session::findPeer(const std::string& identity)
{
  auto it = peers_.find(identity);
  return it == peers_.end() ? nullptr : &it->second;
}

const RemotePeer* Session::findPeer(const std::string& identity) const
{
  auto it = peers_.find(identity);
  return it == peers_.end() ? nullptr : &it->second;
}

TrackHandle Session::addTrack(const std::string& identity, const TrackInfo& info)
{
  RemotePeer* peer = findPeer(identity);
  if (!peer || info.sid.empty())
  {
    return TrackHandle();
  }
  auto it = peer->tracks.find(info.sid);
  if (it != peer->tracks.end())
  {
    it->second.info = info;
    return it->second.handle;
  }
  if (next_track_slot_ > TrackHandle::maxSlot())
  {
    LOG(WARNING) << "[Session] Track slots exhausted in generation " << generation_;
    return TrackHandle();
  }
  RemoteTrack track;
  track.handle = TrackHandle(next_track_slot_++, generation_);
  track.info = info;
  peer->tracks.emplace(info.sid, track);
  return track.handle;
}

bool Session::removeTrack(const std::string& identity, const std::string& sid)
{
  RemotePeer* peer = findPeer(identity);
  return peer && peer->tracks.erase(sid) > 0u;
}

bool Session::hasTrack(const TrackHandle handle) const
{
  if (!handle.isCurrent(generation_))
  {
    return false;
  }
  for (const auto& peer : peers_)
  {
    for (const auto& track : peer.second.tracks)
    {
      if (track.second.handle == handle)
      {
        return true;
      }
    }
  }
  return false;
}

std::vector<std::string> Session::peerIdentities() const
{
  std::vector<std::string> ids;
  ids.reserve(peers_.size());
  for (const auto& peer : peers_)
  {
    ids.push_back(peer.first);
  }
  return ids;
}

} // namespace rl
