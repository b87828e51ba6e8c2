// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/session/udp_bench_transport.hpp>

#include <cerrno>
#include <cstring>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <json/json.h>

#include <rl/common/logging.hpp>
#include <rl/common/time.hpp>

namespace rl {

namespace {

constexpr size_t kMaxDatagramBytes = 65507u;

std::string compactJson(const Json::Value& value)
{
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

} // namespace

bool decodeBenchDatagram(const std::string& text, BenchDatagram* out)
{
  CHECK_NOTNULL(out);
  Json::CharReaderBuilder builder;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors) ||
      !root.isObject())
  {
    return false;
  }
  const Json::Value& event = root["event"];
  const Json::Value& identity = root["identity"];
  if (!event.isString() || !identity.isString() || identity.asString().empty())
  {
    return false;
  }

  BenchDatagram datagram;
  datagram.event = event.asString();
  datagram.identity = identity.asString();
  if (root["role"].isString())
  {
    datagram.role = root["role"].asString();
  }
  if (root["topic"].isString())
  {
    datagram.topic = root["topic"].asString();
  }
  const Json::Value& payload = root["payload"];
  if (payload.isString())
  {
    datagram.payload = payload.asString();
  }
  else if (!payload.isNull())
  {
    datagram.payload = compactJson(payload);
  }
  const Json::Value& tracks = root["tracks"];
  if (tracks.isArray())
  {
    for (const Json::Value& t : tracks)
    {
      if (!t.isObject() || !t["sid"].isString())
      {
        return false;
      }
      TrackInfo info;
      info.sid = t["sid"].asString();
      info.kind = t["kind"].isString() ? t["kind"].asString() : "video";
      info.name = t["name"].isString() ? t["name"].asString() : "";
      datagram.tracks.push_back(info);
    }
  }
  if (datagram.event == "data" && datagram.topic.empty())
  {
    return false;
  }
  *out = std::move(datagram);
  return true;
}

std::string encodeBenchDatagram(const BenchDatagram& datagram)
{
  Json::Value root(Json::objectValue);
  root["event"] = datagram.event;
  root["identity"] = datagram.identity;
  if (!datagram.role.empty())
  {
    root["role"] = datagram.role;
  }
  if (!datagram.topic.empty())
  {
    root["topic"] = datagram.topic;
  }
  if (!datagram.payload.empty())
  {
    root["payload"] = datagram.payload;
  }
  if (!datagram.tracks.empty())
  {
    Json::Value tracks(Json::arrayValue);
    for (const TrackInfo& info : datagram.tracks)
    {
      Json::Value t(Json::objectValue);
      t["sid"] = info.sid;
      t["kind"] = info.kind;
      t["name"] = info.name;
      tracks.append(t);
    }
    root["tracks"] = tracks;
  }
  return compactJson(root);
}

bool parseBenchUrl(const std::string& url, std::string* host, int* port)
{
  CHECK_NOTNULL(host);
  CHECK_NOTNULL(port);
  const std::string scheme = "udp://";
  if (url.compare(0, scheme.size(), scheme) != 0)
  {
    return false;
  }
  const std::string rest = url.substr(scheme.size());
  const size_t colon = rest.rfind(':');
  if (colon == std::string::npos || colon == 0u || colon + 1u >= rest.size())
  {
    return false;
  }
  const std::string port_str = rest.substr(colon + 1u);
  if (port_str.find_first_not_of("0123456789") != std::string::npos || port_str.size() > 5u)
  {
    return false;
  }
  const int value = std::stoi(port_str);
  if (value > 65535)
  {
    return false;
  }
  *host = rest.substr(0u, colon);
  *port = value;
  return true;
}

UdpBenchTransport::UdpBenchTransport(const UdpBenchOptions& options)
  : options_(options)
{
}

UdpBenchTransport::~UdpBenchTransport()
{
  disconnect();
}

std::string UdpBenchTransport::name() const
{
  std::ostringstream ss;
  ss << "bench udp://" << options_.host << ":" << options_.port;
  return ss.str();
}

void UdpBenchTransport::setListener(RoomTransportListener* listener)
{
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = listener;
}

void UdpBenchTransport::openSocket()
{
  std::lock_guard<std::mutex> lock(socket_mutex_);
  if (fd_ >= 0)
  {
    return;
  }
  const int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
  if (fd < 0)
  {
    throw std::runtime_error(std::string("Failed to create UDP socket: ") + std::strerror(errno));
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(options_.port));
  if (inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) != 1)
  {
    ::close(fd);
    throw std::runtime_error("Invalid bench bind address " + options_.host);
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
  {
    const std::string err = std::strerror(errno);
    ::close(fd);
    throw std::runtime_error("Failed to bind " + options_.host + ":" +
                             std::to_string(options_.port) + ": " + err);
  }
  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0)
  {
    bound_port_.store(ntohs(bound.sin_port));
  }
  fd_ = fd;
  receiving_.store(true);
  receive_thread_ = std::thread(&UdpBenchTransport::receiveLoop, this);
  LOG(INFO) << "[Bench] Listening on " << options_.host << ":" << bound_port_.load();
}

void UdpBenchTransport::closeSocket()
{
  receiving_.store(false);
  if (receive_thread_.joinable())
  {
    receive_thread_.join();
  }
  std::lock_guard<std::mutex> lock(socket_mutex_);
  if (fd_ >= 0)
  {
    ::close(fd_);
    fd_ = -1;
  }
}

ConnectAttemptId UdpBenchTransport::connect(const ConnectRequest& request)
{
  ConnectAttemptId attempt = 0u;
  {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    attempt = ++last_attempt_;
    local_identity_ = request.identity;
  }

  ConnectOutcome outcome = ConnectOutcome::Joined;
  std::string detail;
  if (request.token.empty())
  {
    outcome = ConnectOutcome::AuthFailed;
    detail = "empty token";
  }
  else
  {
    try
    {
      openSocket();
    }
    catch (const std::exception& e)
    {
      outcome = ConnectOutcome::Failed;
      detail = e.what();
    }
  }

  std::vector<PeerInfo> peers;
  if (outcome == ConnectOutcome::Joined)
  {
    joined_.store(true);
    peers = peerSnapshot();
  }

  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (listener_)
  {
    listener_->onConnectResult(attempt, outcome, peers, detail);
  }
  return attempt;
}

void UdpBenchTransport::cancelConnect(const ConnectAttemptId attempt)
{
  {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    if (attempt != last_attempt_)
    {
      return;
    }
  }
  VLOG(1) << "[Bench] Cancelling connect attempt " << attempt;
  joined_.store(false);
  closeSocket();
}

void UdpBenchTransport::disconnect()
{
  joined_.store(false);
  unpublishVideoTrack();
  unpublishAudioTrack();
  closeSocket();
}

bool UdpBenchTransport::publishVideoTrack(const std::string& name)
{
  std::lock_guard<std::mutex> lock(video_mutex_);
  if (!joined_.load())
  {
    return false;
  }
  if (!options_.video_dump_path.empty() && !video_dump_.is_open())
  {
    video_dump_.open(options_.video_dump_path, std::ios::binary | std::ios::app);
    if (!video_dump_.is_open())
    {
      LOG(ERROR) << "[Bench] Cannot open video dump " << options_.video_dump_path;
      return false;
    }
  }
  publishing_.store(true);
  LOG(INFO) << "[Bench] Track '" << name << "' published"
            << (options_.video_dump_path.empty() ? "" : " to " + options_.video_dump_path);
  return true;
}

void UdpBenchTransport::unpublishVideoTrack()
{
  std::lock_guard<std::mutex> lock(video_mutex_);
  publishing_.store(false);
  if (video_dump_.is_open())
  {
    video_dump_.close();
  }
}

bool UdpBenchTransport::sendVideoSample(const H264AccessUnit& au)
{
  std::lock_guard<std::mutex> lock(video_mutex_);
  if (!publishing_.load())
  {
    return false;
  }
  if (video_dump_.is_open())
  {
    video_dump_.write(reinterpret_cast<const char*>(au.bytes.data()),
                      static_cast<std::streamsize>(au.bytes.size()));
    if (!video_dump_)
    {
      static int warned_dump = 0;
      if (warned_dump++ < 3)
      {
        LOG(WARNING) << "[Bench] Writing the video dump failed.";
      }
      video_dump_.clear();
    }
  }
  video_samples_.fetch_add(1u);
  return true;
}

bool UdpBenchTransport::publishAudioTrack(const std::string& name, const int sample_rate,
                                          const int channels)
{
  if (!joined_.load())
  {
    return false;
  }
  audio_publishing_.store(true);
  LOG(INFO) << "[Bench] Track '" << name << "' published (" << sample_rate << " Hz, "
            << channels << " channel(s))";
  return true;
}

void UdpBenchTransport::unpublishAudioTrack()
{
  audio_publishing_.store(false);
}

bool UdpBenchTransport::sendAudioFrame(const AudioFrame& /*frame*/)
{
  if (!audio_publishing_.load())
  {
    return false;
  }
  audio_frames_.fetch_add(1u);
  return true;
}

bool UdpBenchTransport::subscribeTrack(const std::string& identity, const std::string& sid)
{
  std::lock_guard<std::mutex> lock(peers_mutex_);
  auto it = peers_.find(identity);
  if (it == peers_.end())
  {
    return false;
  }
  for (const TrackInfo& track : it->second.info.tracks)
  {
    if (track.sid == sid)
    {
      return true;
    }
  }
  return false;
}

bool UdpBenchTransport::sendData(const std::string& topic,
                                 const std::string& payload,
                                 bool /*reliable*/)
{
  if (!joined_.load())
  {
    return false;
  }
  BenchDatagram datagram;
  datagram.event = "data";
  datagram.topic = topic;
  datagram.payload = payload;

  std::vector<sockaddr_in> targets;
  {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    datagram.identity = local_identity_;
    for (const auto& peer : peers_)
    {
      targets.push_back(peer.second.address);
    }
  }
  const std::string text = encodeBenchDatagram(datagram);
  if (text.size() > kMaxDatagramBytes)
  {
    LOG(WARNING) << "[Bench] Dropping " << text.size() << " byte message on " << topic;
    return false;
  }

  std::lock_guard<std::mutex> lock(socket_mutex_);
  if (fd_ < 0)
  {
    return false;
  }
  bool ok = true;
  for (const sockaddr_in& target : targets)
  {
    if (::sendto(fd_, text.data(), text.size(), 0,
                 reinterpret_cast<const sockaddr*>(&target), sizeof(target)) < 0)
    {
      ok = false;
      VLOG(1) << "[Bench] sendto failed: " << std::strerror(errno);
    }
  }
  return ok;
}

std::vector<PeerInfo> UdpBenchTransport::peerSnapshot() const
{
  std::lock_guard<std::mutex> lock(peers_mutex_);
  std::vector<PeerInfo> peers;
  for (const auto& peer : peers_)
  {
    peers.push_back(peer.second.info);
  }
  return peers;
}

void UdpBenchTransport::receiveLoop()
{
  std::vector<char> buffer(kMaxDatagramBytes + 1u);
  int fd = -1;
  {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    fd = fd_;
  }
  while (receiving_.load())
  {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int pr = ::poll(&pfd, 1, options_.poll_timeout_ms);
    if (pr < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }
      LOG(ERROR) << "[Bench] poll failed: " << std::strerror(errno);
      return;
    }
    if (pr == 0)
    {
      continue;
    }
    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t n = ::recvfrom(fd, buffer.data(), buffer.size(), 0,
                                 reinterpret_cast<sockaddr*>(&from), &from_len);
    if (n <= 0)
    {
      continue;
    }
    BenchDatagram datagram;
    if (!decodeBenchDatagram(std::string(buffer.data(), static_cast<size_t>(n)), &datagram))
    {
      static int warned_malformed = 0;
      if (warned_malformed++ < 3)
      {
        LOG(WARNING) << "[Bench] Ignoring malformed datagram (" << n << " bytes).";
      }
      continue;
    }
    handleDatagram(datagram, from);
  }
}

void UdpBenchTransport::handleDatagram(const BenchDatagram& datagram, const sockaddr_in& from)
{
  bool announce_join = false;
  PeerInfo joined_info;
  {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    auto it = peers_.find(datagram.identity);
    if (datagram.event == "join" || (datagram.event == "data" && it == peers_.end()))
    {
      BenchPeer& peer = peers_[datagram.identity];
      peer.info.identity = datagram.identity;
      if (datagram.event == "join" || peer.info.role.empty())
      {
        peer.info.role = datagram.role;
      }
      if (datagram.event == "join")
      {
        peer.info.tracks = datagram.tracks;
      }
      peer.address = from;
      announce_join = true;
      joined_info = peer.info;
    }
    else if (it != peers_.end())
    {
      it->second.address = from;
    }
  }

  if (!joined_.load())
  {
    // Not in the room: remember peers for the next join, report nothing.
    if (datagram.event == "leave")
    {
      std::lock_guard<std::mutex> lock(peers_mutex_);
      peers_.erase(datagram.identity);
    }
    return;
  }

  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (!listener_)
  {
    return;
  }
  if (announce_join)
  {
    listener_->onPeerJoined(joined_info);
  }

  if (datagram.event == "data")
  {
    DataMessage msg;
    msg.topic = datagram.topic;
    msg.origin = datagram.identity;
    msg.payload = datagram.payload;
    msg.arrival_ns = steadyNowNs();
    listener_->onDataReceived(msg);
  }
  else if (datagram.event == "leave")
  {
    {
      std::lock_guard<std::mutex> peers_lock(peers_mutex_);
      peers_.erase(datagram.identity);
    }
    listener_->onPeerLeft(datagram.identity);
  }
  else if (datagram.event == "publish")
  {
    for (const TrackInfo& track : datagram.tracks)
    {
      {
        std::lock_guard<std::mutex> peers_lock(peers_mutex_);
        peers_[datagram.identity].info.tracks.push_back(track);
      }
      listener_->onTrackPublished(datagram.identity, track);
    }
  }
  else if (datagram.event == "unpublish")
  {
    for (const TrackInfo& track : datagram.tracks)
    {
      {
        std::lock_guard<std::mutex> peers_lock(peers_mutex_);
        std::vector<TrackInfo>& tracks = peers_[datagram.identity].info.tracks;
        for (auto it = tracks.begin(); it != tracks.end(); ++it)
        {
          if (it->sid == track.sid)
          {
            tracks.erase(it);
            break;
          }
        }
      }
      listener_->onTrackUnpublished(datagram.identity, track.sid);
    }
  }
  else if (datagram.event == "drop")
  {
    // Simulates a network loss of the whole room.
    joined_.store(false);
    {
      std::lock_guard<std::mutex> video_lock(video_mutex_);
      publishing_.store(false);
    }
    listener_->onDisconnected(DisconnectReason::NetworkLoss, "bench drop by " + datagram.identity);
  }
}

} // namespace rl
