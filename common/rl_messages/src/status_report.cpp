// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/messages/status_report.hpp>

#include <memory>

#include <json/json.h>

namespace rl {

std::string encodeStatusReport(const StatusReport& report)
{
  Json::Value root(Json::objectValue);
  root["type"] = "status";
  root["event"] = report.event;
  root["state"] = report.state;
  if (!report.detail.empty())
  {
    root["detail"] = report.detail;
  }
  root["timestamp"] = static_cast<Json::Int64>(report.timestamp_ms);
  if (!report.counters.empty())
  {
    Json::Value counters(Json::objectValue);
    for (const auto& kv : report.counters)
    {
      counters[kv.first] = static_cast<Json::UInt64>(kv.second);
    }
    root["counters"] = counters;
  }

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, root);
}

bool decodeStatusReport(const std::string& payload, StatusReport* out)
{
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(payload.data(), payload.data() + payload.size(), &root, &errors) ||
      !root.isObject() || !root["type"].isString() || root["type"].asString() != "status")
  {
    return false;
  }

  StatusReport report;
  if (!root["event"].isString() || !root["state"].isString() || !root["timestamp"].isIntegral())
  {
    return false;
  }
  report.event = root["event"].asString();
  report.state = root["state"].asString();
  if (root["detail"].isString())
  {
    report.detail = root["detail"].asString();
  }
  report.timestamp_ms = root["timestamp"].asInt64();
  const Json::Value& counters = root["counters"];
  if (counters.isObject())
  {
    for (const std::string& name : counters.getMemberNames())
    {
      if (counters[name].isUInt64())
      {
        report.counters[name] = counters[name].asUInt64();
      }
    }
  }
  if (out)
  {
    *out = std::move(report);
  }
  return true;
}

} // namespace rl
