// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/session/livekit_room_transport.hpp>

#include <exception>
#include <utility>

#include <rl/common/logging.hpp>
#include <rl/common/time.hpp>

namespace rl {

namespace {

std::string trackKindName(const livekit::TrackKind kind)
{
  return kind == livekit::TrackKind::KIND_AUDIO ? "audio" : "video";
}

} // namespace

DisconnectReason fromLiveKitReason(const livekit::DisconnectReason reason)
{
  switch (reason)
  {
    case livekit::DisconnectReason::ClientInitiated:
      return DisconnectReason::ClientInitiated;
    case livekit::DisconnectReason::DuplicateIdentity:
    case livekit::DisconnectReason::ParticipantRemoved:
    case livekit::DisconnectReason::RoomDeleted:
    case livekit::DisconnectReason::RoomClosed:
      return DisconnectReason::Removed;
    case livekit::DisconnectReason::ServerShutdown:
    case livekit::DisconnectReason::Migration:
      return DisconnectReason::ServerRestart;
    case livekit::DisconnectReason::JoinFailure:
      return DisconnectReason::AuthExpired;
    default:
      return DisconnectReason::NetworkLoss;
  }
}

LiveKitRoomTransport::LiveKitRoomTransport(const LiveKitTransportOptions& options)
  : options_(options)
  , decoder_(options.video)
{
  livekit::initialize(livekit::LogSink::kConsole);
}

LiveKitRoomTransport::~LiveKitRoomTransport()
{
  {
    std::lock_guard<std::mutex> lock(connect_mutex_);
    live_attempt_ = 0u;
  }
  disconnect();
  std::vector<ConnectWorker> workers;
  {
    std::lock_guard<std::mutex> lock(connect_mutex_);
    workers.swap(workers_);
  }
  for (ConnectWorker& worker : workers)
  {
    if (worker.thread.joinable())
    {
      worker.thread.join();
    }
  }
  // Rooms of abandoned attempts are released by their workers.
  livekit::shutdown();
}

void LiveKitRoomTransport::setListener(RoomTransportListener* listener)
{
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = listener;
}

ConnectAttemptId LiveKitRoomTransport::connect(const ConnectRequest& request)
{
  std::lock_guard<std::mutex> lock(connect_mutex_);
  const ConnectAttemptId attempt = ++next_attempt_;
  live_attempt_ = attempt;

  // Reap finished workers.
  for (auto it = workers_.begin(); it != workers_.end();)
  {
    if (it->done->load())
    {
      it->thread.join();
      it = workers_.erase(it);
    }
    else
    {
      ++it;
    }
  }

  if (request.token.empty())
  {
    live_attempt_ = 0u;
    reportConnect(attempt, ConnectOutcome::AuthFailed, {}, "empty access token");
    return attempt;
  }

  ConnectWorker worker;
  worker.done = std::make_shared<std::atomic<bool>>(false);
  std::shared_ptr<std::atomic<bool>> done = worker.done;
  worker.thread = std::thread([this, attempt, request, done]()
  {
    runConnect(attempt, request);
    done->store(true);
  });
  workers_.push_back(std::move(worker));
  VLOG(1) << "[Session] LiveKit attempt " << attempt << " to " << request.url;
  return attempt;
}

void LiveKitRoomTransport::runConnect(const ConnectAttemptId attempt, ConnectRequest request)
{
  std::unique_ptr<livekit::Room> room = std::make_unique<livekit::Room>();
  room->setDelegate(this);

  livekit::RoomOptions room_options;
  // Tracks are subscribed one by one through subscribeTrack().
  room_options.auto_subscribe = false;
  room_options.dynacast = false;

  bool joined = false;
  std::string detail;
  try
  {
    joined = room->Connect(request.url, request.token, room_options);
    if (!joined)
    {
      detail = "connect to " + request.url + " failed";
    }
  }
  catch (const std::exception& e)
  {
    detail = e.what();
  }

  {
    std::lock_guard<std::mutex> lock(connect_mutex_);
    if (live_attempt_ != attempt)
    {
      VLOG(1) << "[Session] LiveKit attempt " << attempt << " abandoned";
      releaseRoom(std::move(room));
      return;
    }
    live_attempt_ = 0u;
  }

  if (!joined)
  {
    releaseRoom(std::move(room));
    reportConnect(attempt, ConnectOutcome::Failed, {}, detail);
    return;
  }

  livekit::Room* joined_room = room.get();
  installRoom(std::move(room));

  std::vector<PeerInfo> peers;
  for (const auto& participant : joined_room->remoteParticipants())
  {
    if (participant)
    {
      peers.push_back(describeParticipant(*participant));
    }
  }
  reportConnect(attempt, ConnectOutcome::Joined, peers, joined_room->room_info().name);
}

void LiveKitRoomTransport::installRoom(std::unique_ptr<livekit::Room> room)
{
  std::unique_ptr<livekit::Room> previous;
  {
    std::lock_guard<std::mutex> lock(room_mutex_);
    previous = std::move(room_);
    room_ = std::move(room);
    current_room_.store(room_.get());
  }
  releaseRoom(std::move(previous));
}

void LiveKitRoomTransport::releaseRoom(std::unique_ptr<livekit::Room> room)
{
  if (!room)
  {
    return;
  }
  room->setDelegate(nullptr);
  room.reset();
}

void LiveKitRoomTransport::cancelConnect(const ConnectAttemptId attempt)
{
  std::lock_guard<std::mutex> lock(connect_mutex_);
  if (live_attempt_ == attempt)
  {
    // The worker drops its room once the SDK returns.
    live_attempt_ = 0u;
  }
}

void LiveKitRoomTransport::disconnect()
{
  unpublishVideoTrack();
  unpublishAudioTrack();
  std::unique_ptr<livekit::Room> room;
  {
    std::lock_guard<std::mutex> lock(room_mutex_);
    current_room_.store(nullptr);
    room = std::move(room_);
  }
  if (room)
  {
    VLOG(1) << "[Session] Leaving LiveKit room";
  }
  releaseRoom(std::move(room));
}

PeerInfo LiveKitRoomTransport::describeParticipant(
    const livekit::RemoteParticipant& participant) const
{
  PeerInfo peer;
  peer.identity = participant.identity();
  const auto& attributes = participant.attributes();
  const auto role = attributes.find(options_.role_attribute);
  peer.role = role != attributes.end() ? role->second : participant.metadata();
  for (const auto& entry : participant.trackPublications())
  {
    const auto& publication = entry.second;
    if (!publication)
    {
      continue;
    }
    TrackInfo track;
    track.sid = publication->sid();
    track.kind = trackKindName(publication->kind());
    track.name = publication->name();
    peer.tracks.push_back(track);
  }
  return peer;
}

void LiveKitRoomTransport::reportConnect(const ConnectAttemptId attempt,
                                         const ConnectOutcome outcome,
                                         const std::vector<PeerInfo>& peers,
                                         const std::string& detail)
{
  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (listener_)
  {
    listener_->onConnectResult(attempt, outcome, peers, detail);
  }
}

bool LiveKitRoomTransport::publishVideoTrack(const std::string& name)
{
  unpublishVideoTrack();
  std::lock_guard<std::mutex> room_lock(room_mutex_);
  if (!room_)
  {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(media_mutex_);
    try
    {
      video_source_ = std::make_shared<livekit::VideoSource>(options_.video.width,
                                                             options_.video.height);
      video_track_ = livekit::LocalVideoTrack::createLocalVideoTrack(name, video_source_);
      livekit::TrackPublishOptions publish_options;
      publish_options.source = livekit::TrackSource::SOURCE_CAMERA;
      auto publication = room_->localParticipant()->publishTrack(video_track_, publish_options);
      video_sid_ = publication ? publication->sid() : std::string();
    }
    catch (const std::exception& e)
    {
      LOG(WARNING) << "[Session] Publishing video track '" << name << "' failed: " << e.what();
      video_source_.reset();
      video_track_.reset();
      video_sid_.clear();
      return false;
    }
  }

  try
  {
    decoder_.start([this](std::vector<uint8_t>&& rgba, int width, int height, int64_t pts_us)
    {
      onDecodedFrame(std::move(rgba), width, height, pts_us);
    });
  }
  catch (const std::runtime_error& e)
  {
    LOG(ERROR) << "[Session] " << e.what();
    std::lock_guard<std::mutex> lock(media_mutex_);
    if (!video_sid_.empty())
    {
      room_->localParticipant()->unpublishTrack(video_sid_);
    }
    video_source_.reset();
    video_track_.reset();
    video_sid_.clear();
    return false;
  }
  video_publishing_.store(true);
  LOG(INFO) << "[Session] Publishing video track '" << name << "' (" << video_sid_ << ")";
  return true;
}

void LiveKitRoomTransport::unpublishVideoTrack()
{
  video_publishing_.store(false);
  // The decoder thread may be inside onDecodedFrame(); stop it unlocked.
  decoder_.stop();
  std::lock_guard<std::mutex> room_lock(room_mutex_);
  std::lock_guard<std::mutex> lock(media_mutex_);
  if (room_ && !video_sid_.empty())
  {
    try
    {
      room_->localParticipant()->unpublishTrack(video_sid_);
    }
    catch (const std::exception& e)
    {
      LOG(WARNING) << "[Session] Unpublishing video track failed: " << e.what();
    }
  }
  video_source_.reset();
  video_track_.reset();
  video_sid_.clear();
}

bool LiveKitRoomTransport::sendVideoSample(const H264AccessUnit& au)
{
  if (!video_publishing_.load())
  {
    return false;
  }
  return decoder_.push(au);
}

void LiveKitRoomTransport::onDecodedFrame(std::vector<uint8_t>&& rgba, const int width,
                                          const int height, const int64_t pts_us)
{
  std::shared_ptr<livekit::VideoSource> source;
  {
    std::lock_guard<std::mutex> lock(media_mutex_);
    source = video_source_;
  }
  if (!source)
  {
    return;
  }
  try
  {
    livekit::VideoFrame frame(width, height, livekit::VideoBufferType::RGBA, std::move(rgba));
    source->captureFrame(frame, pts_us);
  }
  catch (const std::exception& e)
  {
    static int warned_capture = 0;
    if (warned_capture++ < 3)
    {
      LOG(WARNING) << "[Session] Video frame rejected: " << e.what();
    }
  }
}

bool LiveKitRoomTransport::publishAudioTrack(const std::string& name, const int sample_rate,
                                             const int channels)
{
  unpublishAudioTrack();
  std::lock_guard<std::mutex> room_lock(room_mutex_);
  if (!room_)
  {
    return false;
  }
  std::lock_guard<std::mutex> lock(media_mutex_);
  try
  {
    audio_source_ = std::make_shared<livekit::AudioSource>(sample_rate, channels);
    audio_track_ = livekit::LocalAudioTrack::createLocalAudioTrack(name, audio_source_);
    livekit::TrackPublishOptions publish_options;
    publish_options.source = livekit::TrackSource::SOURCE_MICROPHONE;
    auto publication = room_->localParticipant()->publishTrack(audio_track_, publish_options);
    audio_sid_ = publication ? publication->sid() : std::string();
  }
  catch (const std::exception& e)
  {
    LOG(WARNING) << "[Session] Publishing audio track '" << name << "' failed: " << e.what();
    audio_source_.reset();
    audio_track_.reset();
    audio_sid_.clear();
    return false;
  }
  audio_publishing_.store(true);
  LOG(INFO) << "[Session] Publishing audio track '" << name << "' (" << audio_sid_ << ", "
            << sample_rate << " Hz x" << channels << ")";
  return true;
}

void LiveKitRoomTransport::unpublishAudioTrack()
{
  audio_publishing_.store(false);
  std::lock_guard<std::mutex> room_lock(room_mutex_);
  std::lock_guard<std::mutex> lock(media_mutex_);
  if (room_ && !audio_sid_.empty())
  {
    try
    {
      room_->localParticipant()->unpublishTrack(audio_sid_);
    }
    catch (const std::exception& e)
    {
      LOG(WARNING) << "[Session] Unpublishing audio track failed: " << e.what();
    }
  }
  audio_source_.reset();
  audio_track_.reset();
  audio_sid_.clear();
}

bool LiveKitRoomTransport::sendAudioFrame(const AudioFrame& frame)
{
  if (!audio_publishing_.load() || frame.samples.empty())
  {
    return false;
  }
  std::shared_ptr<livekit::AudioSource> source;
  {
    std::lock_guard<std::mutex> lock(media_mutex_);
    source = audio_source_;
  }
  if (!source)
  {
    return false;
  }
  try
  {
    livekit::AudioFrame sdk_frame(frame.samples, frame.sample_rate, frame.channels,
                                  frame.samplesPerChannel());
    source->captureFrame(sdk_frame);
  }
  catch (const std::exception& e)
  {
    static int warned_audio = 0;
    if (warned_audio++ < 3)
    {
      LOG(WARNING) << "[Session] Audio frame rejected: " << e.what();
    }
    return false;
  }
  return true;
}

bool LiveKitRoomTransport::subscribeTrack(const std::string& identity, const std::string& sid)
{
  std::lock_guard<std::mutex> lock(room_mutex_);
  if (!room_)
  {
    return false;
  }
  livekit::RemoteParticipant* participant = room_->remoteParticipant(identity);
  if (!participant)
  {
    return false;
  }
  const auto& publications = participant->trackPublications();
  const auto it = publications.find(sid);
  if (it == publications.end() || !it->second)
  {
    return false;
  }
  it->second->setSubscribed(true);
  VLOG(1) << "[Session] Subscribed " << identity << "/" << sid;
  return true;
}

bool LiveKitRoomTransport::sendData(const std::string& topic, const std::string& payload,
                                    const bool reliable)
{
  std::lock_guard<std::mutex> lock(room_mutex_);
  if (!room_)
  {
    return false;
  }
  try
  {
    room_->localParticipant()->publishData(
        std::vector<uint8_t>(payload.begin(), payload.end()), reliable, {}, topic);
  }
  catch (const std::exception& e)
  {
    static int warned_data = 0;
    if (warned_data++ < 3)
    {
      LOG(WARNING) << "[Session] Sending on '" << topic << "' failed: " << e.what();
    }
    return false;
  }
  return true;
}

void LiveKitRoomTransport::onParticipantConnected(livekit::Room& room,
                                                  const livekit::ParticipantConnectedEvent& event)
{
  if (!isCurrent(room) || !event.participant)
  {
    return;
  }
  const PeerInfo peer = describeParticipant(*event.participant);
  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (listener_)
  {
    listener_->onPeerJoined(peer);
  }
}

void LiveKitRoomTransport::onParticipantDisconnected(
    livekit::Room& room, const livekit::ParticipantDisconnectedEvent& event)
{
  if (!isCurrent(room) || !event.participant)
  {
    return;
  }
  const std::string identity = event.participant->identity();
  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (listener_)
  {
    listener_->onPeerLeft(identity);
  }
}

void LiveKitRoomTransport::onTrackPublished(livekit::Room& room,
                                            const livekit::TrackPublishedEvent& event)
{
  if (!isCurrent(room) || !event.participant || !event.publication)
  {
    return;
  }
  TrackInfo track;
  track.sid = event.publication->sid();
  track.kind = trackKindName(event.publication->kind());
  track.name = event.publication->name();
  const std::string identity = event.participant->identity();
  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (listener_)
  {
    listener_->onTrackPublished(identity, track);
  }
}

void LiveKitRoomTransport::onTrackUnpublished(livekit::Room& room,
                                              const livekit::TrackUnpublishedEvent& event)
{
  if (!isCurrent(room) || !event.participant || !event.publication)
  {
    return;
  }
  const std::string identity = event.participant->identity();
  const std::string sid = event.publication->sid();
  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (listener_)
  {
    listener_->onTrackUnpublished(identity, sid);
  }
}

void LiveKitRoomTransport::onUserPacketReceived(livekit::Room& room,
                                                const livekit::UserDataPacketEvent& event)
{
  if (!isCurrent(room))
  {
    return;
  }
  DataMessage msg;
  msg.topic = event.topic;
  msg.origin = event.participant ? event.participant->identity() : std::string();
  msg.payload.assign(event.data.begin(), event.data.end());
  msg.arrival_ns = steadyNowNs();
  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (listener_)
  {
    listener_->onDataReceived(msg);
  }
}

void LiveKitRoomTransport::onDisconnected(livekit::Room& room,
                                          const livekit::DisconnectedEvent& event)
{
  if (!isCurrent(room))
  {
    return;
  }
  // The room object stays until the next connect() or disconnect() replaces
  // it; it must not be destroyed from its own callback.
  current_room_.store(nullptr);
  video_publishing_.store(false);
  audio_publishing_.store(false);
  const DisconnectReason reason = fromLiveKitReason(event.reason);
  LOG(WARNING) << "[Session] LiveKit room closed: " << disconnectReasonName(reason);
  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (listener_)
  {
    listener_->onDisconnected(reason, "livekit");
  }
}

} // namespace rl
