// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <atomic>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <netinet/in.h>

#include <rl/session/room_transport.hpp>

namespace rl {

//! One datagram of the bench room protocol:
//! {"event":"join"|"leave"|"data"|"publish"|"unpublish"|"drop",
//!  "identity":..,"role":..,"topic":..,"payload":..,"tracks":[{"sid","kind","name"}]}
//! `payload` may be a string or any JSON value (carried as compact JSON).
struct BenchDatagram
{
  std::string event;
  std::string identity;
  std::string role;
  std::string topic;
  std::string payload;
  std::vector<TrackInfo> tracks;
};

bool decodeBenchDatagram(const std::string& text, BenchDatagram* out);
std::string encodeBenchDatagram(const BenchDatagram& datagram);

//! Parses "udp://host:port". Returns false on anything else.
bool parseBenchUrl(const std::string& url, std::string* host, int* port);

struct UdpBenchOptions
{
  std::string host = "127.0.0.1";
  //! 0 binds an ephemeral port (see boundPort()).
  int port = 7880;
  //! Published access units are appended here when set.
  std::string video_dump_path;
  int poll_timeout_ms = 100;
};

//! A room for bench work without a hosted media server: remote peers are
//! processes sending JSON datagrams to a local UDP port. Status and other
//! outbound data go back to the address each peer last sent from.
class UdpBenchTransport : public RoomTransport
{
public:
  explicit UdpBenchTransport(const UdpBenchOptions& options);
  ~UdpBenchTransport() override;

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

  std::string name() const override;

  int boundPort() const { return bound_port_.load(); }
  uint64_t videoSamplesWritten() const { return video_samples_.load(); }
  uint64_t audioFramesSent() const { return audio_frames_.load(); }

private:
  struct BenchPeer
  {
    PeerInfo info;
    sockaddr_in address{};
  };

  void openSocket();
  void closeSocket();
  void receiveLoop();
  void handleDatagram(const BenchDatagram& datagram, const sockaddr_in& from);
  std::vector<PeerInfo> peerSnapshot() const;

  const UdpBenchOptions options_;

  std::mutex listener_mutex_;
  RoomTransportListener* listener_ = nullptr;

  std::mutex socket_mutex_;
  int fd_ = -1;
  std::atomic<int> bound_port_{0};
  std::atomic<bool> receiving_{false};
  std::thread receive_thread_;

  mutable std::mutex peers_mutex_;
  std::map<std::string, BenchPeer> peers_;
  std::string local_identity_;
  std::atomic<bool> joined_{false};
  ConnectAttemptId last_attempt_ = 0u;

  std::mutex video_mutex_;
  std::ofstream video_dump_;
  std::atomic<bool> publishing_{false};
  std::atomic<uint64_t> video_samples_{0};

  std::atomic<bool> audio_publishing_{false};
  std::atomic<uint64_t> audio_frames_{0};
};

} // namespace rl
