// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <memory>

#include <rl/uplink/h264_parser.hpp>

namespace rl {

//! Receiver of the relay's access units (the published video track).
class OutboundTrackSink
{
public:
  using Ptr = std::shared_ptr<OutboundTrackSink>;

  virtual ~OutboundTrackSink() = default;

  //! Non-blocking. Returns false if the sink cannot take a sample right now
  //! (e.g. the session is not publishing yet).
  virtual bool offerSample(const H264AccessUnit& au) = 0;

  //! The capture source failed repeatedly; the publication may be torn down.
  virtual void onSourceLost() {}

  //! Data flows again after onSourceLost().
  virtual void onSourceRestored() {}
};

} // namespace rl
