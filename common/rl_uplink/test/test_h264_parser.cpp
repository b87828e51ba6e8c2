#include <rl/uplink/h264_parser.hpp>
#include <rl/common/test_entrypoint.hpp>

namespace rl {

namespace {

Bytes nal(uint8_t header, std::initializer_list<uint8_t> payload)
{
  Bytes out = {0x00, 0x00, 0x00, 0x01, header};
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

void append(Bytes* dst, const Bytes& src)
{
  dst->insert(dst->end(), src.begin(), src.end());
}

Bytes sps() { return nal(0x67, {0x42, 0xC0, 0x1E, 0x8C}); }
Bytes pps() { return nal(0x68, {0xCE, 0x3C, 0x80}); }
Bytes idr() { return nal(0x65, {0x88, 0x84, 0x21, 0xA0}); }
Bytes pslice() { return nal(0x41, {0x9A, 0x02, 0x4C}); }

} // namespace

TEST(H264ParserTest, CutsAccessUnitsAtSliceBoundaries)
{
  Bytes buffer;
  append(&buffer, sps());
  append(&buffer, pps());
  append(&buffer, idr());
  append(&buffer, pslice());
  append(&buffer, pslice());

  H264Stats stats;
  H264AccessUnit au;
  ASSERT_EQ(h264TryParseAccessUnit(buffer, &au, &stats, H264ParseConfig()),
            H264ParseResult::Parsed);
  EXPECT_EQ(au.nal_count, 3u);
  EXPECT_TRUE(au.keyframe);
  EXPECT_TRUE(au.has_parameter_sets);
  EXPECT_EQ(au.bytes.size(), sps().size() + pps().size() + idr().size());

  ASSERT_EQ(h264TryParseAccessUnit(buffer, &au, &stats, H264ParseConfig()),
            H264ParseResult::Parsed);
  EXPECT_EQ(au.nal_count, 1u);
  EXPECT_FALSE(au.keyframe);
  EXPECT_EQ(au.bytes, pslice());

  // The last slice stays buffered until the next access unit starts.
  EXPECT_EQ(h264TryParseAccessUnit(buffer, &au, &stats, H264ParseConfig()),
            H264ParseResult::NeedMore);
  EXPECT_EQ(buffer, pslice());
  EXPECT_EQ(stats.access_units, 2u);
  EXPECT_EQ(stats.keyframes, 1u);
  EXPECT_EQ(stats.nal_units, 4u);
}

TEST(H264ParserTest, ByteByByteFeedYieldsSameAccessUnits)
{
  Bytes stream;
  append(&stream, sps());
  append(&stream, pps());
  append(&stream, idr());
  for (int i = 0; i < 4; ++i)
  {
    append(&stream, pslice());
  }

  Bytes buffer;
  H264Stats stats;
  std::vector<H264AccessUnit> units;
  for (uint8_t b : stream)
  {
    buffer.push_back(b);
    H264AccessUnit au;
    while (h264TryParseAccessUnit(buffer, &au, &stats, H264ParseConfig()) ==
           H264ParseResult::Parsed)
    {
      units.push_back(au);
    }
  }
  ASSERT_EQ(units.size(), 4u);
  EXPECT_TRUE(units[0].keyframe);
  for (size_t i = 1; i < units.size(); ++i)
  {
    EXPECT_EQ(units[i].bytes, pslice());
  }
  EXPECT_EQ(stats.resyncs, 0u);
}

TEST(H264ParserTest, AccessUnitDelimiterOpensNewUnit)
{
  Bytes buffer;
  append(&buffer, nal(0x09, {0xF0}));
  append(&buffer, pslice());
  append(&buffer, nal(0x09, {0xF0}));
  append(&buffer, pslice());

  H264AccessUnit au;
  ASSERT_EQ(h264TryParseAccessUnit(buffer, &au, nullptr, H264ParseConfig()),
            H264ParseResult::Parsed);
  EXPECT_EQ(au.nal_count, 2u);
}

TEST(H264ParserTest, LeadingGarbageIsDiscarded)
{
  Bytes buffer = {0xAB, 0xCD, 0xEF};
  append(&buffer, idr());
  append(&buffer, pslice());

  H264Stats stats;
  H264AccessUnit au;
  EXPECT_EQ(h264TryParseAccessUnit(buffer, &au, &stats, H264ParseConfig()),
            H264ParseResult::Resync);
  EXPECT_EQ(stats.resyncs, 1u);
  ASSERT_EQ(h264TryParseAccessUnit(buffer, &au, &stats, H264ParseConfig()),
            H264ParseResult::Parsed);
  EXPECT_EQ(au.bytes, idr());
}

TEST(H264ParserTest, UnitsWithoutPictureAreDropped)
{
  Bytes buffer;
  append(&buffer, nal(0x09, {0xF0}));
  append(&buffer, nal(0x09, {0xF0}));
  append(&buffer, pslice());
  append(&buffer, pslice());

  H264Stats stats;
  H264AccessUnit au;
  EXPECT_EQ(h264TryParseAccessUnit(buffer, &au, &stats, H264ParseConfig()),
            H264ParseResult::Resync);
  ASSERT_EQ(h264TryParseAccessUnit(buffer, &au, &stats, H264ParseConfig()),
            H264ParseResult::Parsed);
  EXPECT_EQ(au.nal_count, 2u);
  EXPECT_EQ(stats.access_units, 1u);
}

TEST(H264ParserTest, OversizeBufferIsDropped)
{
  H264ParseConfig cfg;
  cfg.max_access_unit_bytes = 64u;

  Bytes buffer = idr();
  buffer.insert(buffer.end(), 100u, 0xFF);

  H264Stats stats;
  H264AccessUnit au;
  EXPECT_EQ(h264TryParseAccessUnit(buffer, &au, &stats, cfg), H264ParseResult::Resync);
  EXPECT_TRUE(buffer.empty());
  EXPECT_EQ(stats.oversize_drops, 1u);
}

TEST(H264ParserTest, NoStartCodeKeepsTail)
{
  Bytes buffer = {0x11, 0x22, 0x33, 0x44, 0x00, 0x00};
  EXPECT_EQ(h264TryParseAccessUnit(buffer, nullptr, nullptr, H264ParseConfig()),
            H264ParseResult::NeedMore);
  EXPECT_EQ(buffer, (Bytes{0x44, 0x00, 0x00}));
}

TEST(H264ParserTest, NalTypeHelpers)
{
  EXPECT_EQ(h264NalType(0x65), 5u);
  EXPECT_EQ(h264NalType(0x67), 7u);
  EXPECT_TRUE(h264IsVcl(1u));
  EXPECT_TRUE(h264IsVcl(5u));
  EXPECT_FALSE(h264IsVcl(7u));
}

} // namespace rl

RL_UNITTEST_ENTRYPOINT
