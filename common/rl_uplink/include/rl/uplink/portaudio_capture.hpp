// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <mutex>
#include <string>

#include <portaudio.h>

#include <rl/uplink/audio_capture_source.hpp>

namespace rl {

//! Input stream of a PortAudio device, 16 bit interleaved.
class PortAudioCapture : public AudioCaptureSource
{
public:
  //! `device` selects the first input device whose name contains it; empty
  //! selects the default input device.
  explicit PortAudioCapture(const std::string& device = std::string());
  ~PortAudioCapture() override;

  void open(const AudioCaptureFormat& format, Callback callback) override;
  void close() override;
  std::string describe() const override;

private:
  static int streamCallback(const void* input, void* output, unsigned long frame_count,
                            const PaStreamCallbackTimeInfo* time_info,
                            PaStreamCallbackFlags status_flags, void* user_data);

  const std::string device_;
  std::string device_name_;
  AudioCaptureFormat format_;
  Callback callback_;
  PaStream* stream_ = nullptr;
  bool initialized_ = false;
  std::mutex mutex_;
};

} // namespace rl
