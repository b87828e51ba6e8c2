// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <livekit/livekit.h>

#include <rl/session/h264_frame_decoder.hpp>
#include <rl/session/room_transport.hpp>

namespace rl {

struct LiveKitTransportOptions
{
  //! The published camera track carries frames of this size.
  H264DecoderOptions video;
  //! Participant attribute holding the peer's role; metadata is used when
  //! the attribute is absent.
  std::string role_attribute = "role";
};

//! Maps the SDK's disconnect reasons onto the bridge's recoverable and
//! terminal classes.
DisconnectReason fromLiveKitReason(livekit::DisconnectReason reason);

//! RoomTransport on a LiveKit room. Remote tracks are only subscribed on
//! request. The relay's H.264 access units are decoded and re-published
//! through the SDK's camera source. Owns the SDK lifetime, so at most one
//! instance may exist per process.
class LiveKitRoomTransport : public RoomTransport, public livekit::RoomDelegate
{
public:
  explicit LiveKitRoomTransport(const LiveKitTransportOptions& options = LiveKitTransportOptions());
  ~LiveKitRoomTransport() override;

  LiveKitRoomTransport(const LiveKitRoomTransport&) = delete;
  LiveKitRoomTransport& operator=(const LiveKitRoomTransport&) = delete;

  // RoomTransport
  void setListener(RoomTransportListener* listener) override;
  ConnectAttemptId connect(const ConnectRequest& request) override;
  void cancelConnect(ConnectAttemptId attempt) override;
  void disconnect() override;
  bool publishVideoTrack(const std::string& name) override;
  void unpublishVideoTrack() override;
  bool sendVideoSample(const H264AccessUnit& au) override;
  bool publishAudioTrack(const std::string& name, int sample_rate, int channels) override;
  void unpublishAudioTrack() override;
  bool sendAudioFrame(const AudioFrame& frame) override;
  bool subscribeTrack(const std::string& identity, const std::string& sid) override;
  bool sendData(const std::string& topic, const std::string& payload, bool reliable) override;
  std::string name() const override { return "livekit"; }

  // livekit::RoomDelegate
  void onParticipantConnected(livekit::Room& room,
                              const livekit::ParticipantConnectedEvent& event) override;
  void onParticipantDisconnected(livekit::Room& room,
                                 const livekit::ParticipantDisconnectedEvent& event) override;
  void onTrackPublished(livekit::Room& room, const livekit::TrackPublishedEvent& event) override;
  void onTrackUnpublished(livekit::Room& room,
                          const livekit::TrackUnpublishedEvent& event) override;
  void onUserPacketReceived(livekit::Room& room,
                            const livekit::UserDataPacketEvent& event) override;
  void onDisconnected(livekit::Room& room, const livekit::DisconnectedEvent& event) override;

private:
  struct ConnectWorker
  {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void runConnect(ConnectAttemptId attempt, ConnectRequest request);
  void installRoom(std::unique_ptr<livekit::Room> room);
  void releaseRoom(std::unique_ptr<livekit::Room> room);
  bool isCurrent(const livekit::Room& room) const { return current_room_.load() == &room; }
  PeerInfo describeParticipant(const livekit::RemoteParticipant& participant) const;
  void onDecodedFrame(std::vector<uint8_t>&& rgba, int width, int height, int64_t pts_us);
  void reportConnect(ConnectAttemptId attempt, ConnectOutcome outcome,
                     const std::vector<PeerInfo>& peers, const std::string& detail);

  const LiveKitTransportOptions options_;

  std::mutex listener_mutex_;
  RoomTransportListener* listener_ = nullptr;

  // Attempt bookkeeping, guarded by connect_mutex_.
  std::mutex connect_mutex_;
  ConnectAttemptId next_attempt_ = 0u;
  ConnectAttemptId live_attempt_ = 0u;
  std::vector<ConnectWorker> workers_;

  // Joined room, guarded by room_mutex_.
  mutable std::mutex room_mutex_;
  std::unique_ptr<livekit::Room> room_;
  std::atomic<livekit::Room*> current_room_{nullptr};

  // Outbound media, guarded by media_mutex_.
  std::mutex media_mutex_;
  std::shared_ptr<livekit::VideoSource> video_source_;
  std::shared_ptr<livekit::LocalVideoTrack> video_track_;
  std::string video_sid_;
  std::shared_ptr<livekit::AudioSource> audio_source_;
  std::shared_ptr<livekit::LocalAudioTrack> audio_track_;
  std::string audio_sid_;
  std::atomic<bool> video_publishing_{false};
  std::atomic<bool> audio_publishing_{false};

  H264FrameDecoder decoder_;
};

} // namespace rl
