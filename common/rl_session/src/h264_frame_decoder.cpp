// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/session/h264_frame_decoder.hpp>

#include <algorithm>
#include <cstring>
#include <sstream>
#include <stdexcept>

#include <gst/app/gstappsrc.h>

#include <rl/common/logging.hpp>

namespace rl {

H264FrameDecoder::H264FrameDecoder(const H264DecoderOptions& options)
  : options_(options)
{
  CHECK_GT(options_.width, 0);
  CHECK_GT(options_.height, 0);
}

H264FrameDecoder::~H264FrameDecoder()
{
  stop();
}

std::string H264FrameDecoder::pipelineDescription() const
{
  std::ostringstream ss;
  ss << "appsrc name=rl_src is-live=true do-timestamp=true format=time "
     << "caps=video/x-h264,stream-format=byte-stream,alignment=au ! "
     << "queue leaky=downstream max-size-buffers=" << std::max(1, options_.max_queued_units)
     << " ! h264parse ! avdec_h264 ! videoconvert ! videoscale ! "
     << "video/x-raw,format=RGBA,width=" << options_.width << ",height=" << options_.height
     << " ! appsink name=rl_sink emit-signals=true sync=false max-buffers=1 drop=true";
  return ss.str();
}

void H264FrameDecoder::start(FrameCallback callback)
{
  CHECK(callback) << "H264FrameDecoder needs a frame callback.";
  stop();
  std::lock_guard<std::mutex> lock(mutex_);
  callback_ = std::move(callback);

  gst_init(nullptr, nullptr);
  const std::string description = pipelineDescription();
  GError* error = nullptr;
  GstElement* pipeline = gst_parse_launch(description.c_str(), &error);
  if (!pipeline)
  {
    const std::string message = error ? error->message : "unknown error";
    g_clear_error(&error);
    throw std::runtime_error("Failed to create decoder pipeline: " + message);
  }
  if (error)
  {
    // Recoverable parse warning; the pipeline was still built.
    LOG(WARNING) << "[Decoder] " << error->message;
    g_clear_error(&error);
  }

  appsrc_ = gst_bin_get_by_name(GST_BIN(pipeline), "rl_src");
  appsink_ = gst_bin_get_by_name(GST_BIN(pipeline), "rl_sink");
  if (!appsrc_ || !appsink_)
  {
    if (appsrc_)
    {
      gst_object_unref(appsrc_);
    }
    if (appsink_)
    {
      gst_object_unref(appsink_);
    }
    appsrc_ = nullptr;
    appsink_ = nullptr;
    gst_object_unref(pipeline);
    throw std::runtime_error("Decoder pipeline lacks its appsrc or appsink.");
  }
  g_signal_connect(appsink_, "new-sample", G_CALLBACK(&H264FrameDecoder::onNewSample), this);

  if (gst_element_set_state(pipeline, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE)
  {
    gst_object_unref(appsrc_);
    gst_object_unref(appsink_);
    appsrc_ = nullptr;
    appsink_ = nullptr;
    gst_element_set_state(pipeline, GST_STATE_NULL);
    gst_object_unref(pipeline);
    throw std::runtime_error("Failed to start decoder pipeline.");
  }
  pipeline_ = pipeline;
  VLOG(1) << "[Decoder] " << description;
}

void H264FrameDecoder::stop()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (!pipeline_)
  {
    return;
  }
  gst_app_src_end_of_stream(GST_APP_SRC(appsrc_));
  gst_element_set_state(pipeline_, GST_STATE_NULL);
  gst_object_unref(appsrc_);
  gst_object_unref(appsink_);
  gst_object_unref(pipeline_);
  appsrc_ = nullptr;
  appsink_ = nullptr;
  pipeline_ = nullptr;
}

bool H264FrameDecoder::push(const H264AccessUnit& au)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (!pipeline_ || au.bytes.empty())
  {
    return false;
  }
  GstBuffer* buffer = gst_buffer_new_allocate(nullptr, au.bytes.size(), nullptr);
  GstMapInfo map;
  if (!gst_buffer_map(buffer, &map, GST_MAP_WRITE))
  {
    gst_buffer_unref(buffer);
    return false;
  }
  std::memcpy(map.data, au.bytes.data(), au.bytes.size());
  gst_buffer_unmap(buffer, &map);
  if (!au.keyframe)
  {
    GST_BUFFER_FLAG_SET(buffer, GST_BUFFER_FLAG_DELTA_UNIT);
  }
  // Takes ownership of the buffer.
  const GstFlowReturn ret = gst_app_src_push_buffer(GST_APP_SRC(appsrc_), buffer);
  if (ret != GST_FLOW_OK)
  {
    static int warned_push = 0;
    if (warned_push++ < 3)
    {
      LOG(WARNING) << "[Decoder] Pushing access unit " << au.index << " failed: "
                   << gst_flow_get_name(ret);
    }
    return false;
  }
  return true;
}

GstFlowReturn H264FrameDecoder::onNewSample(GstAppSink* sink, gpointer user_data)
{
  H264FrameDecoder* self = static_cast<H264FrameDecoder*>(user_data);
  GstSample* sample = gst_app_sink_pull_sample(sink);
  if (!sample)
  {
    return GST_FLOW_ERROR;
  }

  GstBuffer* buffer = gst_sample_get_buffer(sample);
  GstMapInfo map;
  if (buffer && gst_buffer_map(buffer, &map, GST_MAP_READ))
  {
    const size_t expected =
        static_cast<size_t>(self->options_.width) * self->options_.height * 4u;
    if (map.size >= expected)
    {
      std::vector<uint8_t> rgba(map.data, map.data + expected);
      const int64_t pts_us = GST_BUFFER_PTS_IS_VALID(buffer)
          ? static_cast<int64_t>(GST_TIME_AS_USECONDS(GST_BUFFER_PTS(buffer)))
          : 0;
      self->frames_decoded_.fetch_add(1u);
      self->callback_(std::move(rgba), self->options_.width, self->options_.height, pts_us);
    }
    else
    {
      static int warned_size = 0;
      if (warned_size++ < 3)
      {
        LOG(WARNING) << "[Decoder] Short frame: " << map.size << " bytes, expected "
                     << expected;
      }
    }
    gst_buffer_unmap(buffer, &map);
  }

  gst_sample_unref(sample);
  return GST_FLOW_OK;
}

} // namespace rl
