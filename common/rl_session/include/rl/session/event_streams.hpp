// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <rl/common/generation_handle.hpp>
#include <rl/messages/control_message.hpp>

namespace rl {

//! Keyed, bounded event stream. Each key (usually a peer identity) has its own
//! queue that overwrites its oldest entry when full, so items of one key are
//! delivered in arrival order. Keys are served round-robin; there is no
//! ordering across keys.
template <typename T>
class EventStream
{
public:
  using Ptr = std::shared_ptr<EventStream<T>>;

  explicit EventStream(size_t per_key_capacity)
    : per_key_capacity_(per_key_capacity == 0u ? 1u : per_key_capacity)
  {}

  void push(const std::string& key, T value)
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_)
      {
        return;
      }
      std::deque<T>& queue = queues_[key];
      while (queue.size() >= per_key_capacity_)
      {
        queue.pop_front();
        ++drops_;
      }
      queue.push_back(std::move(value));
      ++pending_;
    }
    cv_.notify_one();
  }

  bool tryPop(T* out)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return popLocked(out);
  }

  //! Waits up to `timeout` for an item. Returns false on timeout or close.
  template <typename Rep, typename Period>
  bool popFor(T* out, const std::chrono::duration<Rep, Period>& timeout)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&]() { return closed_ || pending_ > 0u; });
    return popLocked(out);
  }

  //! Drops everything queued (e.g. when the owning session is rebuilt).
  void clear()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queues_.clear();
    pending_ = 0u;
  }

  void close()
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t size() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
  }

  uint64_t drops() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return drops_;
  }

private:
  bool popLocked(T* out)
  {
    if (pending_ == 0u)
    {
      return false;
    }
    auto it = queues_.upper_bound(last_key_);
    for (size_t i = 0; i <= queues_.size(); ++i)
    {
      if (it == queues_.end())
      {
        it = queues_.begin();
      }
      if (!it->second.empty())
      {
        *out = std::move(it->second.front());
        it->second.pop_front();
        --pending_;
        last_key_ = it->first;
        if (it->second.empty())
        {
          queues_.erase(it);
        }
        return true;
      }
      ++it;
    }
    return false;
  }

  const size_t per_key_capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<std::string, std::deque<T>> queues_;
  std::string last_key_;
  size_t pending_ = 0u;
  uint64_t drops_ = 0u;
  bool closed_ = false;
};

//! Slot = per-session track counter, generation = session generation.
using TrackHandle = GenerationHandle<uint32_t, 24, 8>;

struct TrackAvailable
{
  TrackHandle handle;
  std::string identity;
  std::string role;
  std::string sid;
  std::string kind;
  std::string name;
  bool subscribed = false;
};

using TrackPredicate = std::function<bool(const TrackAvailable&)>;

enum class PeerEventType
{
  Joined,
  Left
};

struct PeerEvent
{
  PeerEventType type = PeerEventType::Joined;
  std::string identity;
  std::string role;
};

using TrackStream = EventStream<TrackAvailable>;
using DataMessageStream = EventStream<DataMessage>;
using ControlMessageStream = EventStream<ControlMessage>;
using PeerEventStream = EventStream<PeerEvent>;

} // namespace rl
