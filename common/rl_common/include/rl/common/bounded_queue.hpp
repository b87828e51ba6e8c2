// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace rl {

//! Thread-safe FIFO with a fixed capacity. push() never blocks: when the queue
//! is full the oldest element is discarded and counted as a drop.
template <typename T>
class OverwritingQueue
{
public:
  explicit OverwritingQueue(size_t capacity)
    : capacity_(std::max<size_t>(1u, capacity))
  {}

  //! Returns the number of elements dropped to make room.
  size_t push(T value)
  {
    size_t dropped = 0u;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_)
      {
        return 0u;
      }
      while (queue_.size() >= capacity_)
      {
        queue_.pop_front();
        ++dropped;
      }
      drops_ += dropped;
      queue_.push_back(std::move(value));
    }
    cv_.notify_one();
    return dropped;
  }

  bool tryPop(T* out)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
    {
      return false;
    }
    *out = std::move(queue_.front());
    queue_.pop_front();
    return true;
  }

  //! Waits up to `timeout` for an element. Returns false on timeout or close.
  template <typename Rep, typename Period>
  bool popFor(T* out, const std::chrono::duration<Rep, Period>& timeout)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&]() { return closed_ || !queue_.empty(); });
    if (queue_.empty())
    {
      return false;
    }
    *out = std::move(queue_.front());
    queue_.pop_front();
    return true;
  }

  void clear()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
  }

  void close()
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  void reopen()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
  }

  size_t size() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  size_t capacity() const { return capacity_; }

  uint64_t drops() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return drops_;
  }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  uint64_t drops_ = 0u;
  bool closed_ = false;
};

} // namespace rl
