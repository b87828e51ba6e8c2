// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/common/backoff.hpp>

#include <algorithm>

#include <rl/common/logging.hpp>

namespace rl {

ExponentialBackoff::ExponentialBackoff(int64_t base_ms, int64_t cap_ms)
  : base_ms_(std::max<int64_t>(1, base_ms))
  , cap_ms_(std::max<int64_t>(1, cap_ms))
{
  if (cap_ms_ < base_ms_)
  {
    LOG(WARNING) << "Backoff cap " << cap_ms_ << "ms below base " << base_ms_
                 << "ms; using base as cap.";
    cap_ms_ = base_ms_;
  }
}

int64_t ExponentialBackoff::peekDelayMs() const
{
  int64_t delay = base_ms_;
  for (int i = 0; i < attempts_ && delay < cap_ms_; ++i)
  {
    delay *= 2;
  }
  return std::min(delay, cap_ms_);
}

int64_t ExponentialBackoff::nextDelayMs()
{
  const int64_t delay = peekDelayMs();
  ++attempts_;
  return delay;
}

} // namespace rl
