// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <chrono>

#include <rl/common/types.hpp>

namespace rl {

constexpr int64_t kNanosPerMilli = 1000000;
constexpr int64_t kNanosPerSecond = 1000000000;

inline constexpr int64_t millisToNanos(int64_t ms) { return ms * kNanosPerMilli; }
inline constexpr int64_t nanosToMillis(int64_t ns) { return ns / kNanosPerMilli; }

inline TimestampNs steadyNowNs()
{
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now().time_since_epoch()).count();
}

//! Wall-clock milliseconds, used only for timestamps sent to remote peers.
inline int64_t wallNowMs()
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace rl
