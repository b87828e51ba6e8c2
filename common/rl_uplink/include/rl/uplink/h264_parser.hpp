// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <rl/common/types.hpp>

namespace rl {

enum class H264NalType : uint8_t
{
  Slice = 1,
  SliceIdr = 5,
  Sei = 6,
  Sps = 7,
  Pps = 8,
  AccessUnitDelimiter = 9,
  EndOfSequence = 10,
  EndOfStream = 11,
  Filler = 12
};

//! One encoded picture of an Annex-B elementary stream, start codes included.
struct H264AccessUnit
{
  Bytes bytes;
  size_t nal_count = 0u;
  bool keyframe = false;
  bool has_parameter_sets = false;
  //! Running index assigned by the relay.
  uint64_t index = 0u;
  TimestampNs received_ns = 0;
};

struct H264ParseConfig
{
  //! A buffer that grows past this without an access-unit boundary is dropped.
  size_t max_access_unit_bytes = 4u * 1024u * 1024u;
};

struct H264Stats
{
  uint64_t access_units = 0;
  uint64_t nal_units = 0;
  uint64_t keyframes = 0;
  uint64_t bytes_received = 0;
  uint64_t resyncs = 0;
  uint64_t oversize_drops = 0;
};

enum class H264ParseResult
{
  NeedMore,
  Parsed,
  Resync
};

inline uint8_t h264NalType(const uint8_t header) { return header & 0x1F; }

inline bool h264IsVcl(const uint8_t nal_type)
{
  return nal_type >= static_cast<uint8_t>(H264NalType::Slice) &&
         nal_type <= static_cast<uint8_t>(H264NalType::SliceIdr);
}

//! Extracts the first complete access unit from the front of `buffer`.
//! An access unit is complete once the start of the next one has been seen:
//! an access unit delimiter, SEI/SPS/PPS after a slice, or a slice whose
//! first_mb_in_slice is zero after a slice. Bytes before the first start code
//! are discarded (counted as a resync). Consumed bytes are erased from `buffer`.
H264ParseResult h264TryParseAccessUnit(std::vector<uint8_t>& buffer,
                                       H264AccessUnit* out,
                                       H264Stats* stats,
                                       const H264ParseConfig& cfg);

} // namespace rl
