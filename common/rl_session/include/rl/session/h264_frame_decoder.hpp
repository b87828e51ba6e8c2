// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>

#include <rl/uplink/h264_parser.hpp>

namespace rl {

struct H264DecoderOptions
{
  //! Decoded frames are scaled to this size.
  int width = 640;
  int height = 480;
  //! Access units waiting for the decoder; older ones are discarded beyond.
  int max_queued_units = 4;
};

//! Decodes an H.264 access-unit stream to RGBA frames with a GStreamer
//! appsrc ! decode ! appsink pipeline. Frames are delivered on the
//! pipeline's streaming thread.
class H264FrameDecoder
{
public:
  //! `rgba` holds width * height * 4 bytes.
  using FrameCallback =
      std::function<void(std::vector<uint8_t>&& rgba, int width, int height, int64_t pts_us)>;

  explicit H264FrameDecoder(const H264DecoderOptions& options = H264DecoderOptions());
  ~H264FrameDecoder();

  H264FrameDecoder(const H264FrameDecoder&) = delete;
  H264FrameDecoder& operator=(const H264FrameDecoder&) = delete;

  //! Builds and starts the pipeline. Throws std::runtime_error on failure.
  void start(FrameCallback callback);
  void stop();
  bool running() const { return pipeline_ != nullptr; }

  //! Non-blocking. False if the decoder is not running.
  bool push(const H264AccessUnit& au);

  uint64_t framesDecoded() const { return frames_decoded_.load(); }

  std::string pipelineDescription() const;

private:
  static GstFlowReturn onNewSample(GstAppSink* sink, gpointer user_data);

  const H264DecoderOptions options_;
  FrameCallback callback_;

  std::mutex mutex_;
  GstElement* pipeline_ = nullptr;
  GstElement* appsrc_ = nullptr;
  GstElement* appsink_ = nullptr;
  std::atomic<uint64_t> frames_decoded_{0};
};

} // namespace rl
