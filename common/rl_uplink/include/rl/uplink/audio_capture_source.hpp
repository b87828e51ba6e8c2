// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace rl {

struct AudioCaptureFormat
{
  int sample_rate = 48000;
  int channels = 1;
  //! Frames per device callback.
  int block_frames = 2400;
};

//! Microphone or other PCM source. The callback runs on the device's thread
//! with `count` interleaved samples and must not block.
class AudioCaptureSource
{
public:
  using Ptr = std::shared_ptr<AudioCaptureSource>;
  using Callback = std::function<void(const int16_t* samples, size_t count)>;

  virtual ~AudioCaptureSource() = default;

  //! Throws std::runtime_error if the device cannot be opened.
  virtual void open(const AudioCaptureFormat& format, Callback callback) = 0;

  //! Stops the device. No callback runs after this returns.
  virtual void close() = 0;

  virtual std::string describe() const = 0;
};

} // namespace rl
