// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <functional>
#include <map>
#include <string>

#include <rl/common/types.hpp>

namespace rl {

//! Outbound telemetry event.
struct StatusReport
{
  std::string event;
  std::string state;
  std::string detail;
  int64_t timestamp_ms = 0;
  std::map<std::string, uint64_t> counters;
};

//! {"type":"status","event":..,"state":..,"detail":..,"timestamp":..[,"counters":{..}]}
std::string encodeStatusReport(const StatusReport& report);

bool decodeStatusReport(const std::string& payload, StatusReport* out);

//! Where components push status reports; the Session Bridge implements it.
using StatusSink = std::function<void(const StatusReport&)>;

} // namespace rl
