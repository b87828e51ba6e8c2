// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <rl/common/types.hpp>
#include <rl/messages/control_message.hpp>
#include <rl/uplink/audio_frame.hpp>
#include <rl/uplink/h264_parser.hpp>

namespace rl {

struct TrackInfo
{
  //! Transport-assigned track id, unique within a room.
  std::string sid;
  //! "video" or "audio".
  std::string kind;
  std::string name;
};

struct PeerInfo
{
  std::string identity;
  //! Free-form role tag, e.g. "controller" or "camera".
  std::string role;
  std::vector<TrackInfo> tracks;
};

struct ConnectRequest
{
  std::string url;
  std::string token;
  std::string room;
  std::string identity;
};

enum class ConnectOutcome
{
  Joined,
  //! Token invalid or expired.
  AuthFailed,
  Failed
};

enum class DisconnectReason
{
  NetworkLoss,
  ServerRestart,
  //! Removed from the room or the room was deleted.
  Removed,
  AuthExpired,
  ClientInitiated
};

inline bool isRecoverable(const DisconnectReason reason)
{
  return reason == DisconnectReason::NetworkLoss || reason == DisconnectReason::ServerRestart;
}

const char* disconnectReasonName(DisconnectReason reason);

using ConnectAttemptId = uint64_t;

//! Callbacks may arrive on any thread, including from inside a RoomTransport
//! call. Implementations must not call back into the transport from them.
class RoomTransportListener
{
public:
  virtual ~RoomTransportListener() = default;

  //! `peers` is the full participant list at join time (Joined only).
  virtual void onConnectResult(ConnectAttemptId attempt,
                               ConnectOutcome outcome,
                               const std::vector<PeerInfo>& peers,
                               const std::string& detail) = 0;
  virtual void onDisconnected(DisconnectReason reason, const std::string& detail) = 0;
  virtual void onPeerJoined(const PeerInfo& peer) = 0;
  virtual void onPeerLeft(const std::string& identity) = 0;
  virtual void onTrackPublished(const std::string& identity, const TrackInfo& track) = 0;
  virtual void onTrackUnpublished(const std::string& identity, const std::string& sid) = 0;
  virtual void onDataReceived(const DataMessage& msg) = 0;
};

//! Room-based real-time transport: participants, data channels, tracks.
class RoomTransport
{
public:
  using Ptr = std::shared_ptr<RoomTransport>;

  virtual ~RoomTransport() = default;

  virtual void setListener(RoomTransportListener* listener) = 0;

  //! Starts an asynchronous join. The result is reported through
  //! onConnectResult() with the returned attempt id.
  virtual ConnectAttemptId connect(const ConnectRequest& request) = 0;

  //! Abandons an in-flight attempt and closes its underlying handle. No
  //! result is reported for a cancelled attempt.
  virtual void cancelConnect(ConnectAttemptId attempt) = 0;

  virtual void disconnect() = 0;

  virtual bool publishVideoTrack(const std::string& name) = 0;
  virtual void unpublishVideoTrack() = 0;

  //! Non-blocking; may be called from any thread. False if not publishing.
  virtual bool sendVideoSample(const H264AccessUnit& au) = 0;

  virtual bool publishAudioTrack(const std::string& name, int sample_rate, int channels) = 0;
  virtual void unpublishAudioTrack() = 0;

  //! Same contract as sendVideoSample().
  virtual bool sendAudioFrame(const AudioFrame& frame) = 0;

  virtual bool subscribeTrack(const std::string& identity, const std::string& sid) = 0;

  virtual bool sendData(const std::string& topic, const std::string& payload, bool reliable) = 0;

  virtual std::string name() const = 0;
};

} // namespace rl
