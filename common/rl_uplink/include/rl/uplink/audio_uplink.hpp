// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

#include <rl/common/bounded_queue.hpp>
#include <rl/uplink/audio_capture_source.hpp>
#include <rl/uplink/audio_frame.hpp>

namespace rl {

struct AudioUplinkOptions
{
  AudioCaptureFormat format;
  //! Length of one outbound frame.
  int frame_ms = 10;
  //! Frames waiting for the sink; the oldest is dropped beyond.
  size_t queue_capacity = 500u;
  int log_stats_interval_s = 10;
};

struct AudioUplinkStats
{
  uint64_t captured_frames = 0;
  uint64_t sent_frames = 0;
  //! Dropped because the queue was full.
  uint64_t dropped_frames = 0;
  //! Refused by the sink (e.g. not publishing).
  uint64_t rejected_frames = 0;
};

//! Cuts the capture device's blocks into fixed-length frames and hands them
//! to the outbound sink from a separate thread. The capture callback never
//! waits on the sink.
class AudioUplink
{
public:
  explicit AudioUplink(const AudioUplinkOptions& options = AudioUplinkOptions());
  ~AudioUplink();

  AudioUplink(const AudioUplink&) = delete;
  AudioUplink& operator=(const AudioUplink&) = delete;

  //! Opens the source. Returns false (and logs) if the device fails to open.
  bool start(AudioCaptureSource::Ptr source, OutboundAudioSink::Ptr sink);
  void stop();

  bool running() const { return running_.load(); }
  AudioUplinkStats stats() const;

  //! Samples per outbound frame, all channels.
  size_t frameSamples() const { return frame_samples_; }

private:
  void onCapture(const int16_t* samples, size_t count);
  void forwardLoop();
  void logStats(double elapsed_s);

  const AudioUplinkOptions options_;
  const size_t frame_samples_;
  AudioCaptureSource::Ptr source_;
  OutboundAudioSink::Ptr sink_;

  std::atomic<bool> running_{false};
  std::thread forward_thread_;
  OverwritingQueue<AudioFrame> queue_;

  //! Capture thread only.
  std::vector<int16_t> partial_;
  TimestampNs partial_start_ns_ = 0;

  std::atomic<uint64_t> captured_{0};
  std::atomic<uint64_t> sent_{0};
  std::atomic<uint64_t> rejected_{0};
  //! Forward thread only.
  AudioUplinkStats last_logged_;
};

} // namespace rl
