#include <rl/uplink/uplink_relay.hpp>
#include <rl/common/test_entrypoint.hpp>

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <stdexcept>
#include <thread>

namespace rl {

namespace {

Bytes nal(uint8_t header, std::initializer_list<uint8_t> payload)
{
  Bytes out = {0x00, 0x00, 0x00, 0x01, header};
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

//! `count` access units: one IDR followed by P slices, plus a trailing slice
//! so the last counted unit is terminated.
Bytes makeStream(int count)
{
  Bytes out = nal(0x65, {0x88, 0x84, 0x21});
  for (int i = 0; i < count; ++i)
  {
    const Bytes p = nal(0x41, {0x9A, static_cast<uint8_t>(i)});
    out.insert(out.end(), p.begin(), p.end());
  }
  return out;
}

bool waitFor(const std::function<bool()>& pred, int timeout_ms = 2000)
{
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline)
  {
    if (pred())
    {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

//! Replays scripted chunks. An empty chunk closes the stream.
class ScriptedEndpoint : public ByteStreamEndpoint
{
public:
  void failNextOpens(int n)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_opens_ = n;
  }

  void addChunk(const Bytes& chunk)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.push_back(chunk);
  }

  void open() override
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_opens_ > 0)
    {
      --failing_opens_;
      throw std::runtime_error("connection refused");
    }
    open_ = true;
    ++opens_;
  }

  ssize_t readSome(uint8_t* buf, size_t n) override
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!chunks_.empty())
      {
        Bytes chunk = chunks_.front();
        if (chunk.empty())
        {
          chunks_.pop_front();
          open_ = false;
          return -1;
        }
        const size_t len = std::min(n, chunk.size());
        std::copy(chunk.begin(), chunk.begin() + len, buf);
        if (len == chunk.size())
        {
          chunks_.pop_front();
        }
        else
        {
          chunks_.front().erase(chunks_.front().begin(), chunks_.front().begin() + len);
        }
        return static_cast<ssize_t>(len);
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    return 0;
  }

  void close() override
  {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
  }

  bool isOpen() const override
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
  }

  std::string describe() const override { return "scripted"; }

  int opens() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return opens_;
  }

private:
  mutable std::mutex mutex_;
  std::deque<Bytes> chunks_;
  int failing_opens_ = 0;
  int opens_ = 0;
  bool open_ = false;
};

class RecordingSink : public OutboundTrackSink
{
public:
  bool offerSample(const H264AccessUnit& au) override
  {
    if (!accept.load())
    {
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    indices_.push_back(au.index);
    return true;
  }

  void onSourceLost() override { ++lost; }
  void onSourceRestored() override { ++restored; }

  std::vector<uint64_t> indices() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return indices_;
  }

  std::atomic<bool> accept{true};
  std::atomic<int> lost{0};
  std::atomic<int> restored{0};

private:
  mutable std::mutex mutex_;
  std::vector<uint64_t> indices_;
};

UplinkRelayOptions fastOptions()
{
  UplinkRelayOptions options;
  options.retry_base_ms = 1;
  options.retry_cap_ms = 4;
  options.stall_retry_ms = 1;
  options.read_chunk_bytes = 7;
  options.log_stats_interval_s = 0;
  return options;
}

} // namespace

TEST(UplinkRelayTest, ForwardsAccessUnitsInOrder)
{
  auto endpoint = std::make_shared<ScriptedEndpoint>();
  auto sink = std::make_shared<RecordingSink>();
  endpoint->addChunk(makeStream(4));

  UplinkRelay relay(fastOptions());
  relay.start(endpoint, sink);
  ASSERT_TRUE(waitFor([&]() { return relay.stats().forwarded == 4u; }));
  relay.stop();

  const std::vector<uint64_t> indices = sink->indices();
  ASSERT_EQ(indices.size(), 4u);
  for (size_t i = 0; i < indices.size(); ++i)
  {
    EXPECT_EQ(indices[i], i);
  }
  EXPECT_EQ(relay.stats().dropped, 0u);
  EXPECT_EQ(sink->lost.load(), 0);
}

TEST(UplinkRelayTest, StalledSinkDropsOldestWithoutBlockingReader)
{
  auto endpoint = std::make_shared<ScriptedEndpoint>();
  auto sink = std::make_shared<RecordingSink>();
  sink->accept = false;
  endpoint->addChunk(makeStream(10));

  UplinkRelay relay(fastOptions());
  relay.start(endpoint, sink);
  ASSERT_TRUE(waitFor([&]() { return relay.stats().parser.access_units == 10u; }));
  EXPECT_TRUE(sink->indices().empty());

  sink->accept = true;
  ASSERT_TRUE(waitFor([&]() {
    const std::vector<uint64_t> indices = sink->indices();
    return !indices.empty() && indices.back() == 9u;
  }));
  relay.stop();

  const UplinkRelayStats stats = relay.stats();
  EXPECT_LE(sink->indices().size(), 2u);
  EXPECT_EQ(stats.forwarded + stats.dropped, 10u);
  EXPECT_GT(stats.sink_rejections, 0u);
}

TEST(UplinkRelayTest, RepeatedFailuresReleaseSourceOnce)
{
  auto endpoint = std::make_shared<ScriptedEndpoint>();
  auto sink = std::make_shared<RecordingSink>();
  endpoint->failNextOpens(7);
  endpoint->addChunk(makeStream(2));

  UplinkRelay relay(fastOptions());
  relay.start(endpoint, sink);
  ASSERT_TRUE(waitFor([&]() { return sink->restored.load() == 1; }));
  ASSERT_TRUE(waitFor([&]() { return relay.stats().forwarded == 2u; }));
  relay.stop();

  EXPECT_EQ(sink->lost.load(), 1);
  EXPECT_EQ(relay.stats().endpoint_failures, 7u);
  EXPECT_FALSE(relay.stats().source_lost);
}

TEST(UplinkRelayTest, FewFailuresKeepSource)
{
  auto endpoint = std::make_shared<ScriptedEndpoint>();
  auto sink = std::make_shared<RecordingSink>();
  endpoint->failNextOpens(4);
  endpoint->addChunk(makeStream(1));

  UplinkRelay relay(fastOptions());
  relay.start(endpoint, sink);
  ASSERT_TRUE(waitFor([&]() { return relay.stats().forwarded == 1u; }));
  relay.stop();

  EXPECT_EQ(sink->lost.load(), 0);
  EXPECT_EQ(sink->restored.load(), 0);
}

TEST(UplinkRelayTest, ReopensAfterStreamCloses)
{
  auto endpoint = std::make_shared<ScriptedEndpoint>();
  auto sink = std::make_shared<RecordingSink>();
  endpoint->addChunk(makeStream(1));
  endpoint->addChunk(Bytes());
  endpoint->addChunk(makeStream(2));

  UplinkRelay relay(fastOptions());
  relay.start(endpoint, sink);
  ASSERT_TRUE(waitFor([&]() { return relay.stats().forwarded == 3u; }));
  relay.stop();

  EXPECT_EQ(endpoint->opens(), 2);
  EXPECT_EQ(relay.stats().endpoint_failures, 1u);
}

TEST(UplinkRelayTest, StopIsIdempotent)
{
  auto endpoint = std::make_shared<ScriptedEndpoint>();
  auto sink = std::make_shared<RecordingSink>();
  UplinkRelay relay(fastOptions());
  relay.start(endpoint, sink);
  EXPECT_TRUE(relay.running());
  relay.stop();
  relay.stop();
  EXPECT_FALSE(relay.running());
}

} // namespace rl

RL_UNITTEST_ENTRYPOINT
