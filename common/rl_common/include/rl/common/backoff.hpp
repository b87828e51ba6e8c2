// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <rl/common/types.hpp>

namespace rl {

//! Capped exponential backoff: base, 2*base, 4*base, ... up to cap.
//! The attempt counter keeps growing after the cap is reached so callers can
//! enforce attempt budgets independently of the delay.
class ExponentialBackoff
{
public:
  ExponentialBackoff(int64_t base_ms, int64_t cap_ms);

  //! Delay to wait before the next attempt; advances the attempt counter.
  int64_t nextDelayMs();

  //! Delay that the next call to nextDelayMs() will return.
  int64_t peekDelayMs() const;

  void reset() { attempts_ = 0; }

  int attempts() const { return attempts_; }
  int64_t baseMs() const { return base_ms_; }
  int64_t capMs() const { return cap_ms_; }

private:
  int64_t base_ms_;
  int64_t cap_ms_;
  int attempts_ = 0;
};

} // namespace rl
