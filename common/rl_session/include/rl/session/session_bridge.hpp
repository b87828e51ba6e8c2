// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <rl/common/backoff.hpp>
#include <rl/messages/status_report.hpp>
#include <rl/session/event_streams.hpp>
#include <rl/session/room_transport.hpp>
#include <rl/session/session.hpp>
#include <rl/uplink/audio_frame.hpp>
#include <rl/uplink/outbound_track_sink.hpp>

namespace rl {

struct SessionBridgeOptions
{
  ConnectRequest request;
  int64_t connect_timeout_ms = 10000;
  int reconnect_attempts = 5;
  int64_t reconnect_base_ms = 1000;
  int64_t reconnect_cap_ms = 30000;
  std::string status_topic = "status";
  std::string video_track_name = "rover-video";
  //! Publish a microphone track next to the video track.
  bool publish_audio = false;
  std::string audio_track_name = "rover-audio";
  int audio_sample_rate = 48000;
  int audio_channels = 1;
  //! Remote tracks matching this are subscribed on arrival. Empty: none.
  TrackPredicate subscribe_filter;
  //! Per-origin capacity of every data stream.
  size_t per_origin_capacity = 4u;
  //! Peer and track events waiting for spinOnce(); beyond this the oldest of
  //! them is dropped. Connect results, disconnects and uplink source changes
  //! are always kept.
  size_t max_pending_events = 256u;
};

struct SessionBridgeStats
{
  uint64_t connects = 0;
  uint64_t reconnect_attempts = 0;
  uint64_t data_routed = 0;
  uint64_t data_unknown_topic = 0;
  uint64_t data_not_connected = 0;
  uint64_t control_malformed = 0;
  uint64_t control_unknown_type = 0;
  uint64_t events_dropped = 0;
  uint64_t fatal = 0;
};

//! Owns the durable room session. Transport callbacks are queued and applied
//! by spinOnce() on the caller's thread; data messages go straight to their
//! topic streams. All timers (connect timeout, reconnect backoff) are
//! evaluated against the `now_ns` passed to start() and spinOnce().
class SessionBridge : public RoomTransportListener
{
public:
  //! `status_observer` sees every status the bridge emits, including those
  //! that cannot be sent because the session is down. It is invoked with
  //! the bridge locked and must not call back into the bridge.
  SessionBridge(RoomTransport::Ptr transport,
                const SessionBridgeOptions& options,
                StatusSink status_observer = StatusSink());
  ~SessionBridge() override;

  SessionBridge(const SessionBridge&) = delete;
  SessionBridge& operator=(const SessionBridge&) = delete;

  //! Disconnected -> Connecting.
  void start(TimestampNs now_ns);

  //! Abandons any in-flight attempt or live session and connects afresh.
  void requestReconnect(TimestampNs now_ns);

  //! Cancels an in-flight attempt, leaves the room, ends in Disconnected.
  void stop();

  //! Applies queued transport events, then timers.
  void spinOnce(TimestampNs now_ns);

  //! Waits up to `timeout_ms` for a queued transport event.
  bool waitForEvents(int64_t timeout_ms);

  SessionState state() const;
  //! True once a Session-Fatal condition ended the session.
  bool fatal() const;
  std::string fatalReason() const;
  uint32_t generation() const;
  std::vector<std::string> peerIdentities() const;
  std::string peerRole(const std::string& identity) const;
  bool isTrackCurrent(TrackHandle handle) const;
  SessionBridgeStats stats() const;

  TrackStream::Ptr onTrackAvailable(TrackPredicate predicate);
  //! Messages on topics nobody asked for are dropped silently.
  DataMessageStream::Ptr onDataMessage(const std::string& topic);
  //! Like onDataMessage(), but decoded with parseControlMessage(). Payloads
  //! that do not decode are counted in the stats and dropped.
  ControlMessageStream::Ptr onControlMessages(const std::string& topic);
  PeerEventStream::Ptr onPeerEvents();

  //! Sends on the status topic. Fills in state and timestamp when unset.
  //! Returns false unless Connected.
  bool sendStatus(StatusReport report);

  //! Sink for the uplink relay. Accepts samples only while the video track
  //! is published. Must not outlive the bridge.
  OutboundTrackSink::Ptr videoSink();

  //! Sink for the audio uplink. Accepts frames only while the audio track is
  //! published. Must not outlive the bridge.
  OutboundAudioSink::Ptr audioSink();

  // RoomTransportListener
  void onConnectResult(ConnectAttemptId attempt,
                       ConnectOutcome outcome,
                       const std::vector<PeerInfo>& peers,
                       const std::string& detail) override;
  void onDisconnected(DisconnectReason reason, const std::string& detail) override;
  void onPeerJoined(const PeerInfo& peer) override;
  void onPeerLeft(const std::string& identity) override;
  void onTrackPublished(const std::string& identity, const TrackInfo& track) override;
  void onTrackUnpublished(const std::string& identity, const std::string& sid) override;
  void onDataReceived(const DataMessage& msg) override;

private:
  class VideoSink;
  class AudioSink;

  enum class EventType
  {
    ConnectResult,
    Disconnected,
    PeerJoined,
    PeerLeft,
    TrackPublished,
    TrackUnpublished,
    UplinkSource
  };

  struct TransportEvent
  {
    EventType type = EventType::ConnectResult;
    ConnectAttemptId attempt = 0u;
    ConnectOutcome outcome = ConnectOutcome::Failed;
    DisconnectReason reason = DisconnectReason::NetworkLoss;
    std::vector<PeerInfo> peers;
    PeerInfo peer;
    TrackInfo track;
    std::string identity;
    std::string detail;
    bool source_lost = false;
  };

  static bool isDroppable(EventType type);
  void pushEvent(TransportEvent event);
  void handleEvent(const TransportEvent& event, TimestampNs now_ns);
  void handleConnectResult(const TransportEvent& event, TimestampNs now_ns);
  void handleTimers(TimestampNs now_ns);

  void beginAttempt(TimestampNs now_ns);
  void cancelAttempt();
  void attemptFailed(const std::string& detail, TimestampNs now_ns);
  void enterConnected(const std::vector<PeerInfo>& peers);
  void teardownSession();
  void failFatal(const std::string& detail);
  void setState(SessionState state, const std::string& detail);
  void emitStatus(const std::string& event, const std::string& detail);
  void announceTrack(const RemotePeer& peer, RemoteTrack* track);
  void updatePublication();
  void clearStreams();

  const SessionBridgeOptions options_;
  const RoomTransport::Ptr transport_;
  const StatusSink status_observer_;

  // Session state, guarded by mutex_.
  mutable std::mutex mutex_;
  SessionState state_ = SessionState::Disconnected;
  std::unique_ptr<Session> session_;
  uint32_t generation_ = 0u;
  bool fatal_ = false;
  std::string fatal_reason_;
  bool attempt_in_flight_ = false;
  ConnectAttemptId attempt_id_ = 0u;
  TimestampNs attempt_started_ns_ = 0;
  TimestampNs next_attempt_ns_ = 0;
  int reconnect_attempts_made_ = 0;
  ExponentialBackoff reconnect_backoff_;
  bool published_ = false;
  bool audio_published_ = false;
  bool source_lost_ = false;
  SessionBridgeStats stats_;

  // Queued transport events.
  std::mutex events_mutex_;
  std::condition_variable events_cv_;
  std::deque<TransportEvent> events_;
  size_t droppable_pending_ = 0u;
  std::atomic<uint64_t> events_dropped_{0};

  // Streams, guarded by streams_mutex_. Read from transport threads.
  mutable std::mutex streams_mutex_;
  std::map<std::string, std::vector<DataMessageStream::Ptr>> data_streams_;
  std::map<std::string, std::vector<ControlMessageStream::Ptr>> control_streams_;
  std::vector<std::pair<TrackPredicate, TrackStream::Ptr>> track_streams_;
  std::vector<PeerEventStream::Ptr> peer_streams_;

  std::atomic<bool> connected_{false};
  std::atomic<bool> publishing_{false};
  std::atomic<bool> audio_publishing_{false};
  std::atomic<uint64_t> data_routed_{0};
  std::atomic<uint64_t> data_unknown_topic_{0};
  std::atomic<uint64_t> data_not_connected_{0};
  std::atomic<uint64_t> control_malformed_{0};
  std::atomic<uint64_t> control_unknown_type_{0};

  std::shared_ptr<VideoSink> video_sink_;
  std::shared_ptr<AudioSink> audio_sink_;
};

} // namespace rl
