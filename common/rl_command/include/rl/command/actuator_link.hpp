// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <memory>
#include <string>

namespace rl {

//! Exclusive output channel to the motor controller. Only the command router
//! writes to it, one write at a time.
class ActuatorLink
{
public:
  using Ptr = std::shared_ptr<ActuatorLink>;

  virtual ~ActuatorLink() = default;

  //! Writes one encoded command completely. Returns false on any failure;
  //! the link reopens itself on a later write.
  virtual bool write(const std::string& bytes) = 0;

  virtual std::string describe() const = 0;
};

} // namespace rl
