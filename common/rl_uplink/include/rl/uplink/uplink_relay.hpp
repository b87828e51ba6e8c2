// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include <rl/common/backoff.hpp>
#include <rl/common/bounded_queue.hpp>
#include <rl/uplink/byte_stream_endpoint.hpp>
#include <rl/uplink/h264_parser.hpp>
#include <rl/uplink/outbound_track_sink.hpp>

namespace rl {

struct UplinkRelayOptions
{
  int64_t retry_base_ms = 500;
  int64_t retry_cap_ms = 5000;
  //! Consecutive endpoint failures before the sink is told the source is lost.
  int max_consecutive_failures = 5;
  //! Retry interval for a sample the sink rejected.
  int64_t stall_retry_ms = 10;
  size_t read_chunk_bytes = 4096;
  int log_stats_interval_s = 5;
  H264ParseConfig parse;
};

struct UplinkRelayStats
{
  H264Stats parser;
  uint64_t forwarded = 0;
  uint64_t dropped = 0;
  uint64_t sink_rejections = 0;
  uint64_t endpoint_failures = 0;
  uint64_t endpoint_opens = 0;
  bool source_lost = false;
};

//! Reads the capture pipeline's H.264 byte stream, cuts it into access units
//! and hands the newest one to the outbound sink. Reading never waits on the
//! sink: the handoff slot holds one access unit and overwrites the oldest.
class UplinkRelay
{
public:
  explicit UplinkRelay(const UplinkRelayOptions& options = UplinkRelayOptions());
  ~UplinkRelay();

  UplinkRelay(const UplinkRelay&) = delete;
  UplinkRelay& operator=(const UplinkRelay&) = delete;

  void start(ByteStreamEndpoint::Ptr endpoint, OutboundTrackSink::Ptr sink);
  void stop();

  bool running() const { return running_.load(); }
  UplinkRelayStats stats() const;

private:
  void readerLoop();
  void forwardLoop();
  void handleEndpointFailure(const std::string& reason,
                             int* consecutive_failures,
                             ExponentialBackoff* backoff);
  //! Sleeps up to `ms`; returns false if stop() was requested meanwhile.
  bool sleepUnlessStopped(int64_t ms);
  void logStats(double elapsed_s);

  const UplinkRelayOptions options_;
  ByteStreamEndpoint::Ptr endpoint_;
  OutboundTrackSink::Ptr sink_;

  std::atomic<bool> running_{false};
  std::thread reader_thread_;
  std::thread forward_thread_;
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  OverwritingQueue<H264AccessUnit> handoff_{1u};

  mutable std::mutex stats_mutex_;
  H264Stats parser_stats_;
  std::atomic<uint64_t> forwarded_{0};
  std::atomic<uint64_t> stall_drops_{0};
  std::atomic<uint64_t> sink_rejections_{0};
  std::atomic<uint64_t> endpoint_failures_{0};
  std::atomic<uint64_t> endpoint_opens_{0};
  std::atomic<bool> source_lost_{false};
  //! Reader thread only.
  UplinkRelayStats last_logged_;
};

} // namespace rl
