// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <rl/common/types.hpp>

namespace rl {

//! Interleaved signed 16 bit PCM.
struct AudioFrame
{
  std::vector<int16_t> samples;
  int sample_rate = 48000;
  int channels = 1;
  //! Steady clock time the first sample was handed over by the capture device.
  TimestampNs capture_ns = 0;

  inline int samplesPerChannel() const
  {
    return channels > 0 ? static_cast<int>(samples.size()) / channels : 0;
  }
};

//! Receiver of the audio uplink's frames (the published microphone track).
class OutboundAudioSink
{
public:
  using Ptr = std::shared_ptr<OutboundAudioSink>;

  virtual ~OutboundAudioSink() = default;

  //! Non-blocking. Returns false if the frame cannot be taken right now.
  virtual bool offerAudio(const AudioFrame& frame) = 0;
};

} // namespace rl
