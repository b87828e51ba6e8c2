// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/uplink/audio_uplink.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <iomanip>

#include <rl/common/logging.hpp>
#include <rl/common/time.hpp>

namespace rl {

namespace {

size_t frame_samples_for(const AudioUplinkOptions& options)
{
  const int64_t per_channel =
      static_cast<int64_t>(options.format.sample_rate) * options.frame_ms / 1000;
  return static_cast<size_t>(std::max<int64_t>(1, per_channel * options.format.channels));
}

} // namespace

AudioUplink::AudioUplink(const AudioUplinkOptions& options)
  : options_(options)
  , frame_samples_(frame_samples_for(options))
  , queue_(options.queue_capacity)
{
  CHECK_GT(options_.format.sample_rate, 0);
  CHECK_GT(options_.format.channels, 0);
  CHECK_GT(options_.frame_ms, 0);
}

AudioUplink::~AudioUplink()
{
  stop();
}

bool AudioUplink::start(AudioCaptureSource::Ptr source, OutboundAudioSink::Ptr sink)
{
  CHECK(source) << "AudioUplink needs a capture source.";
  CHECK(sink) << "AudioUplink needs a sink.";
  if (running_.load())
  {
    LOG(WARNING) << "[Audio] start() called while running; ignoring.";
    return true;
  }
  source_ = std::move(source);
  sink_ = std::move(sink);
  partial_.clear();
  partial_.reserve(frame_samples_);
  queue_.reopen();
  queue_.clear();

  try
  {
    source_->open(options_.format,
                  [this](const int16_t* samples, size_t count) { onCapture(samples, count); });
  }
  catch (const std::exception& e)
  {
    LOG(ERROR) << "[Audio] " << e.what() << "; audio uplink disabled.";
    return false;
  }

  running_.store(true);
  forward_thread_ = std::thread(&AudioUplink::forwardLoop, this);
  LOG(INFO) << "[Audio] Capturing from " << source_->describe() << " at "
            << options_.format.sample_rate << " Hz, " << options_.format.channels
            << " channel(s), " << options_.frame_ms << "ms frames.";
  return true;
}

void AudioUplink::stop()
{
  if (source_)
  {
    source_->close();
  }
  running_.store(false);
  queue_.close();
  if (forward_thread_.joinable())
  {
    forward_thread_.join();
  }
}

AudioUplinkStats AudioUplink::stats() const
{
  AudioUplinkStats s;
  s.captured_frames = captured_.load();
  s.sent_frames = sent_.load();
  s.dropped_frames = queue_.drops();
  s.rejected_frames = rejected_.load();
  return s;
}

void AudioUplink::onCapture(const int16_t* samples, size_t count)
{
  if (!samples)
  {
    return;
  }
  while (count > 0u)
  {
    if (partial_.empty())
    {
      partial_start_ns_ = steadyNowNs();
    }
    const size_t take = std::min(count, frame_samples_ - partial_.size());
    partial_.insert(partial_.end(), samples, samples + take);
    samples += take;
    count -= take;
    if (partial_.size() < frame_samples_)
    {
      break;
    }

    AudioFrame frame;
    frame.samples.swap(partial_);
    frame.sample_rate = options_.format.sample_rate;
    frame.channels = options_.format.channels;
    frame.capture_ns = partial_start_ns_;
    partial_.reserve(frame_samples_);
    captured_.fetch_add(1u);
    if (queue_.push(std::move(frame)) > 0u)
    {
      static int warned_overflow = 0;
      if (warned_overflow++ < 3)
      {
        LOG(WARNING) << "[Audio] Frame queue full; dropping oldest frame.";
      }
    }
  }
}

void AudioUplink::forwardLoop()
{
  auto last_log = std::chrono::steady_clock::now();
  AudioFrame frame;
  while (running_.load())
  {
    if (queue_.popFor(&frame, std::chrono::milliseconds(50)))
    {
      if (sink_->offerAudio(frame))
      {
        sent_.fetch_add(1u);
      }
      else
      {
        rejected_.fetch_add(1u);
      }
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

void AudioUplink::logStats(double elapsed_s)
{
  const AudioUplinkStats s = stats();
  LOG(INFO) << std::fixed << std::setprecision(1)
            << "[Audio] stats frames/s=" << (s.sent_frames - last_logged_.sent_frames) / elapsed_s
            << " captured=" << s.captured_frames
            << " sent=" << s.sent_frames
            << " dropped=" << s.dropped_frames
            << " rejected=" << s.rejected_frames
            << " queued=" << queue_.size();
  last_logged_ = s;
}

} // namespace rl
