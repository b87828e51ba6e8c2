#include <rl/session/udp_bench_transport.hpp>
#include <rl/common/test_entrypoint.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace rl {

namespace {

class RecordingListener : public RoomTransportListener
{
public:
  void onConnectResult(ConnectAttemptId, ConnectOutcome outcome,
                       const std::vector<PeerInfo>& peers, const std::string&) override
  {
    std::lock_guard<std::mutex> lock(mutex);
    outcomes.push_back(outcome);
    joined_peers = peers;
  }
  void onDisconnected(DisconnectReason reason, const std::string&) override
  {
    std::lock_guard<std::mutex> lock(mutex);
    disconnects.push_back(reason);
  }
  void onPeerJoined(const PeerInfo& peer) override
  {
    std::lock_guard<std::mutex> lock(mutex);
    joins.push_back(peer);
  }
  void onPeerLeft(const std::string& identity) override
  {
    std::lock_guard<std::mutex> lock(mutex);
    leaves.push_back(identity);
  }
  void onTrackPublished(const std::string&, const TrackInfo&) override {}
  void onTrackUnpublished(const std::string&, const std::string&) override {}
  void onDataReceived(const DataMessage& msg) override
  {
    std::lock_guard<std::mutex> lock(mutex);
    data.push_back(msg);
  }

  std::mutex mutex;
  std::vector<ConnectOutcome> outcomes;
  std::vector<PeerInfo> joined_peers;
  std::vector<DisconnectReason> disconnects;
  std::vector<PeerInfo> joins;
  std::vector<std::string> leaves;
  std::vector<DataMessage> data;
};

bool waitFor(const std::function<bool()>& pred)
{
  for (int i = 0; i < 500; ++i)
  {
    if (pred())
    {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return false;
}

class Client
{
public:
  explicit Client(int port)
  {
    fd_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    target_.sin_family = AF_INET;
    target_.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, "127.0.0.1", &target_.sin_addr);
  }
  ~Client() { ::close(fd_); }

  void send(const std::string& text)
  {
    ASSERT_GE(::sendto(fd_, text.data(), text.size(), 0,
                       reinterpret_cast<const sockaddr*>(&target_), sizeof(target_)), 0);
  }

  bool receive(std::string* out, int timeout_ms)
  {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    if (::poll(&pfd, 1, timeout_ms) <= 0)
    {
      return false;
    }
    char buf[2048];
    const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n <= 0)
    {
      return false;
    }
    out->assign(buf, static_cast<size_t>(n));
    return true;
  }

private:
  int fd_ = -1;
  sockaddr_in target_{};
};

} // namespace

TEST(BenchDatagramTest, DecodesDataWithObjectPayload)
{
  BenchDatagram d;
  ASSERT_TRUE(decodeBenchDatagram(
      R"({"event":"data","identity":"op1","topic":"controls","payload":{"type":"gamepad"}})", &d));
  EXPECT_EQ(d.event, "data");
  EXPECT_EQ(d.identity, "op1");
  EXPECT_EQ(d.topic, "controls");
  EXPECT_EQ(d.payload, R"({"type":"gamepad"})");
}

TEST(BenchDatagramTest, DecodesJoinWithTracks)
{
  BenchDatagram d;
  ASSERT_TRUE(decodeBenchDatagram(
      R"({"event":"join","identity":"rover-cam","role":"camera","tracks":[{"sid":"TR_1"}]})", &d));
  ASSERT_EQ(d.tracks.size(), 1u);
  EXPECT_EQ(d.tracks[0].sid, "TR_1");
  EXPECT_EQ(d.tracks[0].kind, "video");
  EXPECT_EQ(d.role, "camera");
}

TEST(BenchDatagramTest, RejectsMalformed)
{
  BenchDatagram d;
  EXPECT_FALSE(decodeBenchDatagram("not json", &d));
  EXPECT_FALSE(decodeBenchDatagram(R"({"event":"join"})", &d));
  EXPECT_FALSE(decodeBenchDatagram(R"({"event":"data","identity":"op1"})", &d));
  EXPECT_FALSE(decodeBenchDatagram(R"({"event":"join","identity":"a","tracks":[1]})", &d));
  EXPECT_FALSE(decodeBenchDatagram(R"([1,2])", &d));
}

TEST(BenchDatagramTest, EncodeIsDecodable)
{
  BenchDatagram d;
  d.event = "data";
  d.identity = "rover";
  d.topic = "status";
  d.payload = R"({"event":"x"})";
  BenchDatagram back;
  ASSERT_TRUE(decodeBenchDatagram(encodeBenchDatagram(d), &back));
  EXPECT_EQ(back.payload, d.payload);
  EXPECT_EQ(back.topic, "status");
}

TEST(BenchUrlTest, ParsesHostAndPort)
{
  std::string host;
  int port = 0;
  ASSERT_TRUE(parseBenchUrl("udp://127.0.0.1:7880", &host, &port));
  EXPECT_EQ(host, "127.0.0.1");
  EXPECT_EQ(port, 7880);
  EXPECT_FALSE(parseBenchUrl("wss://example:443", &host, &port));
  EXPECT_FALSE(parseBenchUrl("udp://127.0.0.1", &host, &port));
  EXPECT_FALSE(parseBenchUrl("udp://127.0.0.1:99999", &host, &port));
  EXPECT_FALSE(parseBenchUrl("udp://:80", &host, &port));
}

TEST(UdpBenchTransportTest, EmptyTokenFailsAuth)
{
  UdpBenchOptions options;
  options.port = 0;
  RecordingListener listener;
  UdpBenchTransport transport(options);
  transport.setListener(&listener);
  ConnectRequest request;
  request.identity = "rover";
  transport.connect(request);
  ASSERT_EQ(listener.outcomes.size(), 1u);
  EXPECT_EQ(listener.outcomes[0], ConnectOutcome::AuthFailed);
}

TEST(UdpBenchTransportTest, LoopbackRoom)
{
  UdpBenchOptions options;
  options.port = 0;
  options.poll_timeout_ms = 10;
  RecordingListener listener;
  UdpBenchTransport transport(options);
  transport.setListener(&listener);

  ConnectRequest request;
  request.identity = "rover";
  request.token = "bench";
  transport.connect(request);
  ASSERT_EQ(listener.outcomes.size(), 1u);
  ASSERT_EQ(listener.outcomes[0], ConnectOutcome::Joined);
  ASSERT_GT(transport.boundPort(), 0);

  Client client(transport.boundPort());
  client.send(R"({"event":"join","identity":"op1","role":"controller"})");
  ASSERT_TRUE(waitFor([&]() {
    std::lock_guard<std::mutex> lock(listener.mutex);
    return listener.joins.size() == 1u;
  }));

  client.send(R"({"event":"data","identity":"op1","topic":"controls","payload":"{}"})");
  ASSERT_TRUE(waitFor([&]() {
    std::lock_guard<std::mutex> lock(listener.mutex);
    return listener.data.size() == 1u;
  }));
  {
    std::lock_guard<std::mutex> lock(listener.mutex);
    EXPECT_EQ(listener.data[0].origin, "op1");
    EXPECT_EQ(listener.data[0].topic, "controls");
  }

  ASSERT_TRUE(transport.sendData("status", R"({"event":"hello"})", true));
  std::string reply;
  ASSERT_TRUE(client.receive(&reply, 1000));
  BenchDatagram d;
  ASSERT_TRUE(decodeBenchDatagram(reply, &d));
  EXPECT_EQ(d.identity, "rover");
  EXPECT_EQ(d.topic, "status");

  EXPECT_FALSE(transport.sendVideoSample(H264AccessUnit()));
  ASSERT_TRUE(transport.publishVideoTrack("rover-video"));
  EXPECT_TRUE(transport.sendVideoSample(H264AccessUnit()));
  EXPECT_EQ(transport.videoSamplesWritten(), 1u);

  client.send(R"({"event":"drop","identity":"op1"})");
  ASSERT_TRUE(waitFor([&]() {
    std::lock_guard<std::mutex> lock(listener.mutex);
    return listener.disconnects.size() == 1u;
  }));
  EXPECT_FALSE(transport.sendVideoSample(H264AccessUnit()));

  transport.connect(request);
  std::lock_guard<std::mutex> lock(listener.mutex);
  ASSERT_EQ(listener.outcomes.size(), 2u);
  ASSERT_EQ(listener.joined_peers.size(), 1u);
  EXPECT_EQ(listener.joined_peers[0].identity, "op1");
}

} // namespace rl

RL_UNITTEST_ENTRYPOINT
