// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/uplink/uplink_relay.hpp>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <stdexcept>
#include <vector>

#include <rl/common/logging.hpp>
#include <rl/common/time.hpp>

namespace rl {

UplinkRelay::UplinkRelay(const UplinkRelayOptions& options)
  : options_(options)
{
}

UplinkRelay::~UplinkRelay()
{
  stop();
}

void UplinkRelay::start(ByteStreamEndpoint::Ptr endpoint, OutboundTrackSink::Ptr sink)
{
  CHECK(endpoint) << "UplinkRelay needs an endpoint.";
  CHECK(sink) << "UplinkRelay needs a sink.";
  if (running_.exchange(true))
  {
    LOG(WARNING) << "[Uplink] start() called while running; ignoring.";
    return;
  }
  endpoint_ = std::move(endpoint);
  sink_ = std::move(sink);
  handoff_.reopen();
  handoff_.clear();
  reader_thread_ = std::thread(&UplinkRelay::readerLoop, this);
  forward_thread_ = std::thread(&UplinkRelay::forwardLoop, this);
}

void UplinkRelay::stop()
{
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    running_.store(false);
  }
  stop_cv_.notify_all();
  handoff_.close();
  if (reader_thread_.joinable())
  {
    reader_thread_.join();
  }
  if (forward_thread_.joinable())
  {
    forward_thread_.join();
  }
  if (endpoint_)
  {
    endpoint_->close();
  }
}

UplinkRelayStats UplinkRelay::stats() const
{
  UplinkRelayStats s;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    s.parser = parser_stats_;
  }
  s.forwarded = forwarded_.load();
  s.dropped = handoff_.drops() + stall_drops_.load();
  s.sink_rejections = sink_rejections_.load();
  s.endpoint_failures = endpoint_failures_.load();
  s.endpoint_opens = endpoint_opens_.load();
  s.source_lost = source_lost_.load();
  return s;
}

bool UplinkRelay::sleepUnlessStopped(int64_t ms)
{
  std::unique_lock<std::mutex> lock(stop_mutex_);
  stop_cv_.wait_for(lock, std::chrono::milliseconds(ms), [&]() { return !running_.load(); });
  return running_.load();
}

void UplinkRelay::handleEndpointFailure(const std::string& reason,
                                        int* consecutive_failures,
                                        ExponentialBackoff* backoff)
{
  endpoint_->close();
  endpoint_failures_.fetch_add(1u);
  ++(*consecutive_failures);

  const int64_t delay_ms = backoff->nextDelayMs();
  if (*consecutive_failures <= 3 || *consecutive_failures == options_.max_consecutive_failures)
  {
    LOG(WARNING) << "[Uplink] " << reason << " (failure " << *consecutive_failures
                 << "); retrying in " << delay_ms << "ms.";
  }

  if (*consecutive_failures >= options_.max_consecutive_failures && !source_lost_.load())
  {
    source_lost_.store(true);
    LOG(ERROR) << "[Uplink] Capture source lost after " << *consecutive_failures
               << " consecutive failures; releasing outbound publication.";
    handoff_.clear();
    sink_->onSourceLost();
  }
  sleepUnlessStopped(delay_ms);
}

void UplinkRelay::readerLoop()
{
  ExponentialBackoff backoff(options_.retry_base_ms, options_.retry_cap_ms);
  int consecutive_failures = 0;
  uint64_t next_index = 0;

  std::vector<uint8_t> buffer;
  buffer.reserve(256 * 1024);
  std::vector<uint8_t> scratch(std::max<size_t>(1u, options_.read_chunk_bytes));

  auto last_log = std::chrono::steady_clock::now();

  while (running_.load())
  {
    if (!endpoint_->isOpen())
    {
      try
      {
        endpoint_->open();
        endpoint_opens_.fetch_add(1u);
        buffer.clear();
        LOG(INFO) << "[Uplink] Reading video from " << endpoint_->describe();
      }
      catch (const std::exception& e)
      {
        handleEndpointFailure(e.what(), &consecutive_failures, &backoff);
        continue;
      }
    }

    const ssize_t n = endpoint_->readSome(scratch.data(), scratch.size());
    if (n < 0)
    {
      buffer.clear();
      handleEndpointFailure("Video stream " + endpoint_->describe() + " closed",
                            &consecutive_failures, &backoff);
      continue;
    }
    if (n == 0)
    {
      continue;
    }

    if (consecutive_failures > 0)
    {
      LOG(INFO) << "[Uplink] Video stream resumed after " << consecutive_failures
                << " failure(s).";
      consecutive_failures = 0;
    }
    backoff.reset();
    if (source_lost_.exchange(false))
    {
      LOG(INFO) << "[Uplink] Capture source restored.";
      sink_->onSourceRestored();
    }

    buffer.insert(buffer.end(), scratch.begin(), scratch.begin() + n);
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      parser_stats_.bytes_received += static_cast<uint64_t>(n);
    }

    while (running_.load())
    {
      H264AccessUnit au;
      H264ParseResult res;
      {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        res = h264TryParseAccessUnit(buffer, &au, &parser_stats_, options_.parse);
      }
      if (res == H264ParseResult::Parsed)
      {
        au.index = next_index++;
        au.received_ns = steadyNowNs();
        handoff_.push(std::move(au));
        continue;
      }
      if (res == H264ParseResult::Resync)
      {
        continue;
      }
      break;
    }

    if (options_.log_stats_interval_s > 0)
    {
      const auto now = std::chrono::steady_clock::now();
      const double elapsed = std::chrono::duration<double>(now - last_log).count();
      if (elapsed >= static_cast<double>(options_.log_stats_interval_s))
      {
        logStats(elapsed);
        last_log = now;
      }
    }
  }
}

void UplinkRelay::forwardLoop()
{
  H264AccessUnit pending;
  bool has_pending = false;

  while (running_.load())
  {
    if (!has_pending)
    {
      has_pending = handoff_.popFor(&pending, std::chrono::milliseconds(50));
      if (!has_pending)
      {
        continue;
      }
    }

    if (sink_->offerSample(pending))
    {
      forwarded_.fetch_add(1u);
      has_pending = false;
      continue;
    }

    sink_rejections_.fetch_add(1u);
    // Sink stalled: keep the sample only until something newer arrives.
    H264AccessUnit newer;
    if (handoff_.popFor(&newer, std::chrono::milliseconds(options_.stall_retry_ms)))
    {
      stall_drops_.fetch_add(1u);
      pending = std::move(newer);
    }
  }
}

void UplinkRelay::logStats(double elapsed_s)
{
  const UplinkRelayStats s = stats();
  const double aus_rate = (s.parser.access_units - last_logged_.parser.access_units) / elapsed_s;
  const double bytes_rate = (s.parser.bytes_received - last_logged_.parser.bytes_received) / elapsed_s;
  LOG(INFO) << std::fixed << std::setprecision(1)
            << "[Uplink] stats access_units/s=" << aus_rate
            << " bytes/s=" << bytes_rate
            << " keyframes=" << s.parser.keyframes
            << " forwarded=" << s.forwarded
            << " dropped=" << s.dropped
            << " resyncs=" << s.parser.resyncs
            << " oversize_drops=" << s.parser.oversize_drops;
  last_logged_ = s;
}

} // namespace rl
