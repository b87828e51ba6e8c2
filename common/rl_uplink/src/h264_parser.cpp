// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/uplink/h264_parser.hpp>

#include <algorithm>

#include <rl/common/logging.hpp>

namespace rl {

namespace {

constexpr size_t kShortStartCode = 3;
constexpr size_t kNotFound = static_cast<size_t>(-1);

//! Position of the next 00 00 01 at or after `from`, or kNotFound.
size_t find_start_code(const std::vector<uint8_t>& buf, size_t from)
{
  if (buf.size() < kShortStartCode)
  {
    return kNotFound;
  }
  for (size_t i = from; i + 2 < buf.size(); ++i)
  {
    if (buf[i + 2] > 1)
    {
      // Neither of the next two positions can start a start code ending here.
      i += 2;
      continue;
    }
    if (buf[i] == 0 && buf[i + 1] == 0 && buf[i + 2] == 1)
    {
      return i;
    }
  }
  return kNotFound;
}

//! Includes the zero_byte of a four-byte start code.
size_t nal_begin(const std::vector<uint8_t>& buf, size_t start_code_pos)
{
  if (start_code_pos > 0 && buf[start_code_pos - 1] == 0)
  {
    return start_code_pos - 1;
  }
  return start_code_pos;
}

bool starts_new_access_unit(uint8_t nal_type, uint8_t first_payload_byte, bool seen_vcl)
{
  if (nal_type == static_cast<uint8_t>(H264NalType::AccessUnitDelimiter))
  {
    return true;
  }
  if (!seen_vcl)
  {
    return false;
  }
  switch (nal_type)
  {
  case static_cast<uint8_t>(H264NalType::Sei):
  case static_cast<uint8_t>(H264NalType::Sps):
  case static_cast<uint8_t>(H264NalType::Pps):
  case 14:
  case 15:
  case 16:
  case 17:
  case 18:
    return true;
  default:
    break;
  }
  if (h264IsVcl(nal_type))
  {
    // first_mb_in_slice is ue(v); a leading 1 bit encodes the value 0.
    return (first_payload_byte & 0x80) != 0;
  }
  return false;
}

void drop_oversize(std::vector<uint8_t>& buffer, H264Stats* stats, size_t limit)
{
  static int warned_oversize = 0;
  if (warned_oversize++ < 3)
  {
    LOG(WARNING) << "[H264] No access unit boundary within " << limit
                 << " bytes; dropping buffer.";
  }
  buffer.clear();
  if (stats)
  {
    stats->oversize_drops++;
    stats->resyncs++;
  }
}

} // namespace

H264ParseResult h264TryParseAccessUnit(std::vector<uint8_t>& buffer,
                                       H264AccessUnit* out,
                                       H264Stats* stats,
                                       const H264ParseConfig& cfg)
{
  const size_t first = find_start_code(buffer, 0);
  if (first == kNotFound)
  {
    // Keep a possible partial start code at the tail.
    if (buffer.size() > kShortStartCode)
    {
      buffer.erase(buffer.begin(),
                   buffer.end() - static_cast<std::ptrdiff_t>(kShortStartCode));
      if (stats)
      {
        stats->resyncs++;
      }
    }
    return H264ParseResult::NeedMore;
  }

  const size_t first_begin = nal_begin(buffer, first);
  if (first_begin > 0)
  {
    buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(first_begin));
    if (stats)
    {
      stats->resyncs++;
    }
    return H264ParseResult::Resync;
  }

  size_t nal_count = 0u;
  bool seen_vcl = false;
  bool keyframe = false;
  bool has_parameter_sets = false;
  size_t sc = first;
  while (true)
  {
    const size_t header_pos = sc + kShortStartCode;
    // The header byte plus one payload byte decide whether this NAL opens a
    // new access unit.
    if (header_pos + 1 >= buffer.size())
    {
      break;
    }
    const uint8_t nal_type = h264NalType(buffer[header_pos]);
    const uint8_t first_payload_byte = buffer[header_pos + 1];

    if (nal_count > 0 && starts_new_access_unit(nal_type, first_payload_byte, seen_vcl))
    {
      const size_t end = nal_begin(buffer, sc);
      if (!seen_vcl)
      {
        // Delimiters or parameter sets without a picture.
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(end));
        if (stats)
        {
          stats->resyncs++;
        }
        return H264ParseResult::Resync;
      }

      H264AccessUnit au;
      au.bytes.assign(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(end));
      au.nal_count = nal_count;
      au.keyframe = keyframe;
      au.has_parameter_sets = has_parameter_sets;
      buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(end));
      if (stats)
      {
        stats->access_units++;
        stats->nal_units += nal_count;
        if (keyframe)
        {
          stats->keyframes++;
        }
      }
      if (out)
      {
        *out = std::move(au);
      }
      return H264ParseResult::Parsed;
    }

    ++nal_count;
    if (h264IsVcl(nal_type))
    {
      seen_vcl = true;
      keyframe = keyframe || nal_type == static_cast<uint8_t>(H264NalType::SliceIdr);
    }
    else if (nal_type == static_cast<uint8_t>(H264NalType::Sps))
    {
      has_parameter_sets = true;
    }

    const size_t next = find_start_code(buffer, header_pos + 1);
    if (next == kNotFound)
    {
      break;
    }
    sc = next;
  }

  if (buffer.size() > cfg.max_access_unit_bytes)
  {
    drop_oversize(buffer, stats, cfg.max_access_unit_bytes);
    return H264ParseResult::Resync;
  }
  return H264ParseResult::NeedMore;
}

} // namespace rl
