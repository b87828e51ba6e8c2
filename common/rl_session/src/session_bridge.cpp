// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/session/session_bridge.hpp>

#include <algorithm>
#include <chrono>

#include <rl/common/logging.hpp>
#include <rl/common/time.hpp>

namespace rl {

class SessionBridge::VideoSink : public OutboundTrackSink
{
public:
  explicit VideoSink(SessionBridge* bridge)
    : bridge_(bridge)
  {}

  bool offerSample(const H264AccessUnit& au) override
  {
    if (!bridge_->publishing_.load())
    {
      return false;
    }
    return bridge_->transport_->sendVideoSample(au);
  }

  void onSourceLost() override
  {
    TransportEvent event;
    event.type = EventType::UplinkSource;
    event.source_lost = true;
    bridge_->pushEvent(std::move(event));
  }

  void onSourceRestored() override
  {
    TransportEvent event;
    event.type = EventType::UplinkSource;
    event.source_lost = false;
    bridge_->pushEvent(std::move(event));
  }

private:
  SessionBridge* bridge_;
};

class SessionBridge::AudioSink : public OutboundAudioSink
{
public:
  explicit AudioSink(SessionBridge* bridge)
    : bridge_(bridge)
  {}

  bool offerAudio(const AudioFrame& frame) override
  {
    if (!bridge_->audio_publishing_.load())
    {
      return false;
    }
    return bridge_->transport_->sendAudioFrame(frame);
  }

private:
  SessionBridge* bridge_;
};

SessionBridge::SessionBridge(RoomTransport::Ptr transport,
                             const SessionBridgeOptions& options,
                             StatusSink status_observer)
  : options_(options)
  , transport_(std::move(transport))
  , status_observer_(std::move(status_observer))
  , reconnect_backoff_(options.reconnect_base_ms, options.reconnect_cap_ms)
{
  CHECK(transport_) << "SessionBridge needs a transport.";
  CHECK_GT(options_.connect_timeout_ms, 0);
  CHECK_GE(options_.reconnect_attempts, 0);
  transport_->setListener(this);
  video_sink_ = std::make_shared<VideoSink>(this);
  audio_sink_ = std::make_shared<AudioSink>(this);
}

SessionBridge::~SessionBridge()
{
  stop();
  transport_->setListener(nullptr);
  std::lock_guard<std::mutex> lock(streams_mutex_);
  for (auto& topic : data_streams_)
  {
    for (auto& stream : topic.second)
    {
      stream->close();
    }
  }
  for (auto& topic : control_streams_)
  {
    for (auto& stream : topic.second)
    {
      stream->close();
    }
  }
  for (auto& entry : track_streams_)
  {
    entry.second->close();
  }
  for (auto& stream : peer_streams_)
  {
    stream->close();
  }
}

// -----------------------------------------------------------------------------
// Public API.

void SessionBridge::start(const TimestampNs now_ns)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != SessionState::Disconnected)
  {
    LOG(WARNING) << "[Session] start() while " << sessionStateName(state_) << "; ignoring.";
    return;
  }
  fatal_ = false;
  fatal_reason_.clear();
  LOG(INFO) << "[Session] Joining room '" << options_.request.room << "' at "
            << options_.request.url << " as '" << options_.request.identity
            << "' via " << transport_->name();
  setState(SessionState::Connecting, "start");
  beginAttempt(now_ns);
}

void SessionBridge::requestReconnect(const TimestampNs now_ns)
{
  std::lock_guard<std::mutex> lock(mutex_);
  cancelAttempt();
  if (state_ == SessionState::Connected)
  {
    teardownSession();
    transport_->disconnect();
  }
  fatal_ = false;
  fatal_reason_.clear();
  reconnect_attempts_made_ = 0;
  reconnect_backoff_.reset();
  setState(SessionState::Connecting, "reconnect requested");
  beginAttempt(now_ns);
}

void SessionBridge::stop()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == SessionState::Disconnected)
  {
    return;
  }
  cancelAttempt();
  if (state_ == SessionState::Connected)
  {
    if (published_)
    {
      transport_->unpublishVideoTrack();
    }
    if (audio_published_)
    {
      transport_->unpublishAudioTrack();
    }
    teardownSession();
    transport_->disconnect();
  }
  setState(SessionState::Disconnected, "stopped");
}

bool SessionBridge::waitForEvents(const int64_t timeout_ms)
{
  std::unique_lock<std::mutex> lock(events_mutex_);
  return events_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [&]() { return !events_.empty(); });
}

void SessionBridge::spinOnce(const TimestampNs now_ns)
{
  std::deque<TransportEvent> events;
  {
    std::lock_guard<std::mutex> lock(events_mutex_);
    events.swap(events_);
    droppable_pending_ = 0u;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const TransportEvent& event : events)
  {
    handleEvent(event, now_ns);
  }
  handleTimers(now_ns);
  updatePublication();
}

SessionState SessionBridge::state() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool SessionBridge::fatal() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return fatal_;
}

std::string SessionBridge::fatalReason() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return fatal_reason_;
}

uint32_t SessionBridge::generation() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

std::vector<std::string> SessionBridge::peerIdentities() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return session_ ? session_->peerIdentities() : std::vector<std::string>();
}

std::string SessionBridge::peerRole(const std::string& identity) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  const RemotePeer* peer = session_ ? session_->findPeer(identity) : nullptr;
  return peer ? peer->role : std::string();
}

bool SessionBridge::isTrackCurrent(const TrackHandle handle) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return session_ && session_->hasTrack(handle);
}

SessionBridgeStats SessionBridge::stats() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  SessionBridgeStats s = stats_;
  s.data_routed = data_routed_.load();
  s.data_unknown_topic = data_unknown_topic_.load();
  s.data_not_connected = data_not_connected_.load();
  s.control_malformed = control_malformed_.load();
  s.control_unknown_type = control_unknown_type_.load();
  s.events_dropped = events_dropped_.load();
  return s;
}

TrackStream::Ptr SessionBridge::onTrackAvailable(TrackPredicate predicate)
{
  CHECK(predicate) << "onTrackAvailable needs a predicate.";
  auto stream = std::make_shared<TrackStream>(options_.per_origin_capacity);
  std::lock_guard<std::mutex> lock(streams_mutex_);
  track_streams_.emplace_back(std::move(predicate), stream);
  return stream;
}

DataMessageStream::Ptr SessionBridge::onDataMessage(const std::string& topic)
{
  auto stream = std::make_shared<DataMessageStream>(options_.per_origin_capacity);
  std::lock_guard<std::mutex> lock(streams_mutex_);
  data_streams_[topic].push_back(stream);
  return stream;
}

ControlMessageStream::Ptr SessionBridge::onControlMessages(const std::string& topic)
{
  auto stream = std::make_shared<ControlMessageStream>(options_.per_origin_capacity);
  std::lock_guard<std::mutex> lock(streams_mutex_);
  control_streams_[topic].push_back(stream);
  return stream;
}

PeerEventStream::Ptr SessionBridge::onPeerEvents()
{
  auto stream = std::make_shared<PeerEventStream>(16u);
  std::lock_guard<std::mutex> lock(streams_mutex_);
  peer_streams_.push_back(stream);
  return stream;
}

bool SessionBridge::sendStatus(StatusReport report)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (report.state.empty())
  {
    report.state = sessionStateName(state_);
  }
  if (report.timestamp_ms == 0)
  {
    report.timestamp_ms = wallNowMs();
  }
  if (state_ != SessionState::Connected)
  {
    return false;
  }
  return transport_->sendData(options_.status_topic, encodeStatusReport(report), true);
}

OutboundTrackSink::Ptr SessionBridge::videoSink()
{
  return video_sink_;
}

OutboundAudioSink::Ptr SessionBridge::audioSink()
{
  return audio_sink_;
}

// -----------------------------------------------------------------------------
// Transport callbacks.

bool SessionBridge::isDroppable(const EventType type)
{
  switch (type)
  {
  case EventType::PeerJoined:
  case EventType::PeerLeft:
  case EventType::TrackPublished:
  case EventType::TrackUnpublished:
    return true;
  default:
    return false;
  }
}

void SessionBridge::pushEvent(TransportEvent event)
{
  {
    std::lock_guard<std::mutex> lock(events_mutex_);
    if (isDroppable(event.type))
    {
      if (droppable_pending_ >= options_.max_pending_events)
      {
        auto oldest = std::find_if(events_.begin(), events_.end(),
                                   [](const TransportEvent& e) { return isDroppable(e.type); });
        if (oldest != events_.end())
        {
          events_.erase(oldest);
          --droppable_pending_;
        }
        static int warned_events = 0;
        if (warned_events++ < 3)
        {
          LOG(WARNING) << "[Session] Transport event queue full; dropping oldest peer event.";
        }
        events_dropped_.fetch_add(1u);
      }
      ++droppable_pending_;
    }
    events_.push_back(std::move(event));
  }
  events_cv_.notify_all();
}

void SessionBridge::onConnectResult(const ConnectAttemptId attempt,
                                    const ConnectOutcome outcome,
                                    const std::vector<PeerInfo>& peers,
                                    const std::string& detail)
{
  TransportEvent event;
  event.type = EventType::ConnectResult;
  event.attempt = attempt;
  event.outcome = outcome;
  event.peers = peers;
  event.detail = detail;
  pushEvent(std::move(event));
}

void SessionBridge::onDisconnected(const DisconnectReason reason, const std::string& detail)
{
  TransportEvent event;
  event.type = EventType::Disconnected;
  event.reason = reason;
  event.detail = detail;
  pushEvent(std::move(event));
}

void SessionBridge::onPeerJoined(const PeerInfo& peer)
{
  TransportEvent event;
  event.type = EventType::PeerJoined;
  event.peer = peer;
  pushEvent(std::move(event));
}

void SessionBridge::onPeerLeft(const std::string& identity)
{
  TransportEvent event;
  event.type = EventType::PeerLeft;
  event.identity = identity;
  pushEvent(std::move(event));
}

void SessionBridge::onTrackPublished(const std::string& identity, const TrackInfo& track)
{
  TransportEvent event;
  event.type = EventType::TrackPublished;
  event.identity = identity;
  event.track = track;
  pushEvent(std::move(event));
}

void SessionBridge::onTrackUnpublished(const std::string& identity, const std::string& sid)
{
  TransportEvent event;
  event.type = EventType::TrackUnpublished;
  event.identity = identity;
  event.track.sid = sid;
  pushEvent(std::move(event));
}

void SessionBridge::onDataReceived(const DataMessage& msg)
{
  std::lock_guard<std::mutex> lock(streams_mutex_);
  const auto raw = data_streams_.find(msg.topic);
  const auto decoded = control_streams_.find(msg.topic);
  if (raw == data_streams_.end() && decoded == control_streams_.end())
  {
    data_unknown_topic_.fetch_add(1u);
    VLOG(1) << "[Session] Dropping message on unknown topic '" << msg.topic << "'";
    return;
  }
  if (!connected_.load() || msg.origin == options_.request.identity)
  {
    data_not_connected_.fetch_add(1u);
    return;
  }
  DataMessage stamped = msg;
  if (stamped.arrival_ns == 0)
  {
    stamped.arrival_ns = steadyNowNs();
  }
  data_routed_.fetch_add(1u);
  if (raw != data_streams_.end())
  {
    for (auto& stream : raw->second)
    {
      stream->push(stamped.origin, stamped);
    }
  }
  if (decoded == control_streams_.end())
  {
    return;
  }

  ControlMessage parsed;
  const ControlParseResult result = parseControlMessage(stamped, &parsed);
  if (result == ControlParseResult::UnknownType)
  {
    control_unknown_type_.fetch_add(1u);
    VLOG(1) << "[Session] Ignoring message of unknown type on '" << msg.topic << "' from '"
            << msg.origin << "'";
    return;
  }
  if (result != ControlParseResult::Parsed)
  {
    control_malformed_.fetch_add(1u);
    static int warned_malformed = 0;
    if (warned_malformed++ < 3)
    {
      LOG(WARNING) << "[Session] Malformed message on '" << msg.topic << "' from '"
                   << msg.origin << "': " << msg.payload.substr(0, 80);
    }
    return;
  }
  for (auto& stream : decoded->second)
  {
    stream->push(parsed.origin, parsed);
  }
}

// -----------------------------------------------------------------------------
// State machine. Everything below runs with mutex_ held.

void SessionBridge::handleEvent(const TransportEvent& event, const TimestampNs now_ns)
{
  switch (event.type)
  {
  case EventType::ConnectResult:
    handleConnectResult(event, now_ns);
    return;
  case EventType::UplinkSource:
    if (source_lost_ != event.source_lost)
    {
      source_lost_ = event.source_lost;
      emitStatus(source_lost_ ? "uplink_source_lost" : "uplink_source_restored", "");
    }
    return;
  case EventType::Disconnected:
    if (state_ != SessionState::Connected)
    {
      return;
    }
    teardownSession();
    if (!isRecoverable(event.reason))
    {
      failFatal(std::string("disconnected: ") + disconnectReasonName(event.reason) +
                (event.detail.empty() ? "" : " (" + event.detail + ")"));
      return;
    }
    reconnect_attempts_made_ = 0;
    reconnect_backoff_.reset();
    next_attempt_ns_ = now_ns + millisToNanos(reconnect_backoff_.nextDelayMs());
    setState(SessionState::Reconnecting, disconnectReasonName(event.reason));
    return;
  default:
    break;
  }

  if (state_ != SessionState::Connected || !session_)
  {
    return;
  }

  switch (event.type)
  {
  case EventType::PeerJoined:
  {
    RemotePeer* peer = session_->addPeer(event.peer);
    if (!peer)
    {
      return;
    }
    LOG(INFO) << "[Session] Peer joined: " << peer->identity << " (role '" << peer->role << "')";
    {
      std::lock_guard<std::mutex> lock(streams_mutex_);
      for (auto& stream : peer_streams_)
      {
        stream->push(peer->identity, PeerEvent{PeerEventType::Joined, peer->identity, peer->role});
      }
    }
    for (auto& track : peer->tracks)
    {
      announceTrack(*peer, &track.second);
    }
    return;
  }
  case EventType::PeerLeft:
  {
    const RemotePeer* peer = session_->findPeer(event.identity);
    if (!peer)
    {
      return;
    }
    const PeerEvent left{PeerEventType::Left, peer->identity, peer->role};
    session_->removePeer(event.identity);
    LOG(INFO) << "[Session] Peer left: " << event.identity;
    std::lock_guard<std::mutex> lock(streams_mutex_);
    for (auto& stream : peer_streams_)
    {
      stream->push(left.identity, left);
    }
    return;
  }
  case EventType::TrackPublished:
  {
    const TrackHandle handle = session_->addTrack(event.identity, event.track);
    RemotePeer* peer = session_->findPeer(event.identity);
    if (!handle.valid() || !peer)
    {
      return;
    }
    announceTrack(*peer, &peer->tracks.at(event.track.sid));
    return;
  }
  case EventType::TrackUnpublished:
    session_->removeTrack(event.identity, event.track.sid);
    return;
  default:
    return;
  }
}

void SessionBridge::handleConnectResult(const TransportEvent& event, const TimestampNs now_ns)
{
  if (!attempt_in_flight_ || event.attempt != attempt_id_)
  {
    VLOG(1) << "[Session] Ignoring result of stale connect attempt " << event.attempt;
    return;
  }
  attempt_in_flight_ = false;

  switch (event.outcome)
  {
  case ConnectOutcome::Joined:
    enterConnected(event.peers);
    return;
  case ConnectOutcome::AuthFailed:
    failFatal("authentication failed" + (event.detail.empty() ? "" : ": " + event.detail));
    return;
  case ConnectOutcome::Failed:
    attemptFailed(event.detail.empty() ? "connect failed" : event.detail, now_ns);
    return;
  }
}

void SessionBridge::handleTimers(const TimestampNs now_ns)
{
  if (attempt_in_flight_ &&
      now_ns - attempt_started_ns_ >= millisToNanos(options_.connect_timeout_ms))
  {
    cancelAttempt();
    attemptFailed("connect timeout after " + std::to_string(options_.connect_timeout_ms) + "ms",
                  now_ns);
  }
  if (state_ == SessionState::Reconnecting && !attempt_in_flight_ && now_ns >= next_attempt_ns_)
  {
    beginAttempt(now_ns);
  }
}

void SessionBridge::beginAttempt(const TimestampNs now_ns)
{
  if (state_ == SessionState::Reconnecting)
  {
    ++reconnect_attempts_made_;
    ++stats_.reconnect_attempts;
    LOG(INFO) << "[Session] Reconnect attempt " << reconnect_attempts_made_ << "/"
              << options_.reconnect_attempts;
  }
  attempt_in_flight_ = true;
  attempt_started_ns_ = now_ns;
  attempt_id_ = transport_->connect(options_.request);
}

void SessionBridge::cancelAttempt()
{
  if (!attempt_in_flight_)
  {
    return;
  }
  transport_->cancelConnect(attempt_id_);
  attempt_in_flight_ = false;
}

void SessionBridge::attemptFailed(const std::string& detail, const TimestampNs now_ns)
{
  if (state_ == SessionState::Connecting)
  {
    failFatal(detail);
    return;
  }
  if (state_ != SessionState::Reconnecting)
  {
    return;
  }
  if (reconnect_attempts_made_ >= options_.reconnect_attempts)
  {
    failFatal("reconnect attempts exhausted (" + std::to_string(reconnect_attempts_made_) +
              "), last error: " + detail);
    return;
  }
  const int64_t delay_ms = reconnect_backoff_.nextDelayMs();
  next_attempt_ns_ = now_ns + millisToNanos(delay_ms);
  LOG(WARNING) << "[Session] Reconnect attempt " << reconnect_attempts_made_
               << " failed: " << detail << "; next in " << delay_ms << "ms.";
}

void SessionBridge::enterConnected(const std::vector<PeerInfo>& peers)
{
  generation_ = TrackHandle::nextGeneration(generation_);
  session_ = std::make_unique<Session>(generation_, options_.request.identity);
  clearStreams();
  for (const PeerInfo& info : peers)
  {
    session_->addPeer(info);
  }
  ++stats_.connects;
  const bool was_reconnect = state_ == SessionState::Reconnecting;
  reconnect_attempts_made_ = 0;
  reconnect_backoff_.reset();
  setState(SessionState::Connected,
           (was_reconnect ? "rejoined with " : "joined with ") +
           std::to_string(session_->peers().size()) + " peer(s)");

  {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    for (const auto& peer : session_->peers())
    {
      for (auto& stream : peer_streams_)
      {
        stream->push(peer.first, PeerEvent{PeerEventType::Joined, peer.first, peer.second.role});
      }
    }
  }

  updatePublication();

  for (auto& entry : session_->peers())
  {
    RemotePeer* peer = session_->findPeer(entry.first);
    for (auto& track : peer->tracks)
    {
      announceTrack(*peer, &track.second);
    }
  }
}

void SessionBridge::teardownSession()
{
  published_ = false;
  publishing_.store(false);
  audio_published_ = false;
  audio_publishing_.store(false);
  connected_.store(false);
  if (!session_)
  {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    for (const auto& peer : session_->peers())
    {
      for (auto& stream : peer_streams_)
      {
        stream->push(peer.first, PeerEvent{PeerEventType::Left, peer.first, peer.second.role});
      }
    }
  }
  session_.reset();
  clearStreams();
}

void SessionBridge::failFatal(const std::string& detail)
{
  cancelAttempt();
  teardownSession();
  const bool first = !fatal_;
  fatal_ = true;
  fatal_reason_ = detail;
  setState(SessionState::Disconnected, detail);
  if (first)
  {
    ++stats_.fatal;
    LOG(ERROR) << "[Session] Fatal: " << detail << ". Operator intervention required.";
    emitStatus("session_fatal", detail);
  }
}

void SessionBridge::setState(const SessionState state, const std::string& detail)
{
  if (state_ == state)
  {
    return;
  }
  LOG(INFO) << "[Session] " << sessionStateName(state_) << " -> " << sessionStateName(state)
            << (detail.empty() ? "" : " (" + detail + ")");
  state_ = state;
  connected_.store(state == SessionState::Connected);
  emitStatus("session_state", detail);
}

void SessionBridge::emitStatus(const std::string& event, const std::string& detail)
{
  StatusReport report;
  report.event = event;
  report.state = sessionStateName(state_);
  report.detail = detail;
  report.timestamp_ms = wallNowMs();
  if (status_observer_)
  {
    status_observer_(report);
  }
  if (state_ == SessionState::Connected)
  {
    if (!transport_->sendData(options_.status_topic, encodeStatusReport(report), true))
    {
      VLOG(1) << "[Session] Could not send status '" << event << "'";
    }
  }
}

void SessionBridge::announceTrack(const RemotePeer& peer, RemoteTrack* track)
{
  TrackAvailable available;
  available.handle = track->handle;
  available.identity = peer.identity;
  available.role = peer.role;
  available.sid = track->info.sid;
  available.kind = track->info.kind;
  available.name = track->info.name;

  if (!track->subscribed && options_.subscribe_filter && options_.subscribe_filter(available))
  {
    if (transport_->subscribeTrack(peer.identity, track->info.sid))
    {
      track->subscribed = true;
      LOG(INFO) << "[Session] Subscribed to " << track->info.kind << " track "
                << track->info.sid << " of " << peer.identity;
    }
    else
    {
      LOG(WARNING) << "[Session] Failed to subscribe to track " << track->info.sid << " of "
                   << peer.identity;
    }
  }
  available.subscribed = track->subscribed;

  std::lock_guard<std::mutex> lock(streams_mutex_);
  for (auto& entry : track_streams_)
  {
    if (entry.first(available))
    {
      entry.second->push(peer.identity, available);
    }
  }
}

void SessionBridge::updatePublication()
{
  const bool want = state_ == SessionState::Connected && !source_lost_;
  if (want && !published_)
  {
    if (transport_->publishVideoTrack(options_.video_track_name))
    {
      published_ = true;
      publishing_.store(true);
      LOG(INFO) << "[Session] Publishing video track '" << options_.video_track_name << "'";
    }
    else
    {
      static int warned_publish = 0;
      if (warned_publish++ < 3)
      {
        LOG(WARNING) << "[Session] Failed to publish video track; retrying.";
      }
    }
  }
  else if (!want && published_)
  {
    publishing_.store(false);
    transport_->unpublishVideoTrack();
    published_ = false;
    LOG(INFO) << "[Session] Video track unpublished.";
  }

  const bool want_audio = state_ == SessionState::Connected && options_.publish_audio;
  if (want_audio && !audio_published_)
  {
    if (transport_->publishAudioTrack(options_.audio_track_name, options_.audio_sample_rate,
                                      options_.audio_channels))
    {
      audio_published_ = true;
      audio_publishing_.store(true);
      LOG(INFO) << "[Session] Publishing audio track '" << options_.audio_track_name << "'";
    }
    else
    {
      static int warned_audio = 0;
      if (warned_audio++ < 3)
      {
        LOG(WARNING) << "[Session] Failed to publish audio track; retrying.";
      }
    }
  }
  else if (!want_audio && audio_published_)
  {
    audio_publishing_.store(false);
    transport_->unpublishAudioTrack();
    audio_published_ = false;
  }
}

void SessionBridge::clearStreams()
{
  std::lock_guard<std::mutex> lock(streams_mutex_);
  for (auto& topic : data_streams_)
  {
    for (auto& stream : topic.second)
    {
      stream->clear();
    }
  }
  for (auto& topic : control_streams_)
  {
    for (auto& stream : topic.second)
    {
      stream->clear();
    }
  }
  for (auto& entry : track_streams_)
  {
    entry.second->clear();
  }
}

} // namespace rl
