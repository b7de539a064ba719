/**
 * @file test_value.cpp
 * @brief Unit tests for field value parsing
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "gapscan/value.hpp"

using namespace gapscan;

static std::int64_t instant(const std::string& text) {
  Value v;
  std::string err;
  EXPECT_TRUE(parse_value(text, Format::Rfc3339, v, &err)) << text << ": " << err;
  EXPECT_EQ(v.kind, Value::Kind::Instant);
  return v.epoch_ms;
}

// Test: All format names are recognized
TEST(ValueParserTest, ParsesFormatNames)
{
  Format f = Format::UInt;
  EXPECT_TRUE(parse_format("int", f));
  EXPECT_EQ(f, Format::Int);
  EXPECT_TRUE(parse_format("unix_ms", f));
  EXPECT_EQ(f, Format::UnixMs);
  EXPECT_TRUE(parse_format("rfc-3339", f));
  EXPECT_EQ(f, Format::Rfc3339);
  EXPECT_FALSE(parse_format("rfc3339", f));
  EXPECT_FALSE(parse_format("", f));
}

// Test: Unsigned integers
TEST(ValueParserTest, ParsesUnsigned)
{
  Value v;
  ASSERT_TRUE(parse_value("1936", Format::UInt, v));
  EXPECT_EQ(v.kind, Value::Kind::Unsigned);
  EXPECT_EQ(v.unsigned_value, 1936u);

  ASSERT_TRUE(parse_value("9223372036854775807", Format::UInt, v));
  EXPECT_EQ(v.unsigned_value, 9223372036854775807ull);
}

// Test: Unsigned rejects signs, junk and values beyond 2^63-1
TEST(ValueParserTest, RejectsInvalidUnsigned)
{
  Value v;
  std::string err;
  EXPECT_FALSE(parse_value("-1", Format::UInt, v, &err));
  EXPECT_FALSE(parse_value("+1", Format::UInt, v, &err));
  EXPECT_FALSE(parse_value("12a", Format::UInt, v, &err));
  EXPECT_FALSE(parse_value("N/A", Format::UInt, v, &err));
  EXPECT_EQ(err, "invalid digit found in string");
  EXPECT_FALSE(parse_value("9223372036854775808", Format::UInt, v, &err));
  EXPECT_EQ(err, "number too large (> 2^63-1)");
  EXPECT_FALSE(parse_value("18446744073709551616", Format::UInt, v, &err));
  EXPECT_EQ(err, "number out of range");
}

// Test: Whitespace and enclosing quotes around a field are ignored
TEST(ValueParserTest, IgnoresWhitespaceAndQuotes)
{
  Value v;
  ASSERT_TRUE(parse_value(" 7 ", Format::UInt, v));
  EXPECT_EQ(v.unsigned_value, 7u);
  ASSERT_TRUE(parse_value("\"8\"", Format::UInt, v));
  EXPECT_EQ(v.unsigned_value, 8u);
  EXPECT_FALSE(parse_value("\"", Format::UInt, v));
  EXPECT_FALSE(parse_value("   ", Format::Int, v));
}

// Test: Signed integers accept both signs
TEST(ValueParserTest, ParsesSigned)
{
  Value v;
  ASSERT_TRUE(parse_value("-42", Format::Int, v));
  EXPECT_EQ(v.kind, Value::Kind::Signed);
  EXPECT_EQ(v.signed_value, -42);
  ASSERT_TRUE(parse_value("+42", Format::Int, v));
  EXPECT_EQ(v.signed_value, 42);
  ASSERT_TRUE(parse_value("-9223372036854775808", Format::Int, v));
  EXPECT_EQ(v.signed_value, INT64_MIN);

  EXPECT_FALSE(parse_value("9223372036854775808", Format::Int, v));
  EXPECT_FALSE(parse_value("+-5", Format::Int, v));
  EXPECT_FALSE(parse_value("1.5", Format::Int, v));
}

// Test: Unix seconds and milliseconds map to the same instant
TEST(ValueParserTest, ParsesUnixTimestamps)
{
  Value secs;
  Value millis;
  ASSERT_TRUE(parse_value("1704067200", Format::Unix, secs));
  ASSERT_TRUE(parse_value("1704067200000", Format::UnixMs, millis));
  EXPECT_EQ(secs.kind, Value::Kind::Instant);
  EXPECT_EQ(secs.epoch_ms, millis.epoch_ms);

  ASSERT_TRUE(parse_value("-1", Format::Unix, secs));
  EXPECT_EQ(secs.epoch_ms, -1000);

  EXPECT_FALSE(parse_value("9223372036854775807", Format::Unix, secs));
  EXPECT_FALSE(parse_value("1704067200.5", Format::Unix, secs));
}

// Test: RFC 3339 with Z and with numeric offsets
TEST(ValueParserTest, ParsesRfc3339)
{
  EXPECT_EQ(instant("1970-01-01T00:00:00Z"), 0);
  EXPECT_EQ(instant("2024-01-01T00:00:00Z"), 1704067200000LL);
  EXPECT_EQ(instant("2024-01-01T02:00:00+02:00"), 1704067200000LL);
  EXPECT_EQ(instant("2023-12-31T19:30:00-04:30"), 1704067200000LL);
  EXPECT_EQ(instant("2024-01-01t00:00:00z"), 1704067200000LL);
  EXPECT_EQ(instant("2024-01-01_00:00:00Z"), 1704067200000LL);
  EXPECT_EQ(instant("2024-01-01 00:00:00Z"), 1704067200000LL);
}

// Test: Fractional seconds are kept to the millisecond
TEST(ValueParserTest, ParsesFractionalSeconds)
{
  EXPECT_EQ(instant("1970-01-01T00:00:00.5Z"), 500);
  EXPECT_EQ(instant("1970-01-01T00:00:01.123456Z"), 1123);
}

// Test: Leap days and leap seconds
TEST(ValueParserTest, HandlesLeapDaysAndSeconds)
{
  Value v;
  EXPECT_TRUE(parse_value("2024-02-29T00:00:00Z", Format::Rfc3339, v));
  EXPECT_FALSE(parse_value("2023-02-29T00:00:00Z", Format::Rfc3339, v));
  EXPECT_EQ(instant("2016-12-31T23:59:60Z"), instant("2017-01-01T00:00:00Z"));
}

// Test: Malformed RFC 3339 timestamps fail with a reason
TEST(ValueParserTest, RejectsMalformedRfc3339)
{
  Value v;
  std::string err;
  EXPECT_FALSE(parse_value("2024-01-01T00:00:00", Format::Rfc3339, v, &err));
  EXPECT_EQ(err, "missing UTC offset");
  EXPECT_FALSE(parse_value("2024-13-01T00:00:00Z", Format::Rfc3339, v, &err));
  EXPECT_EQ(err, "month out of range");
  EXPECT_FALSE(parse_value("2024-01-01T24:00:00Z", Format::Rfc3339, v, &err));
  EXPECT_EQ(err, "time out of range");
  EXPECT_FALSE(parse_value("2024-1-01T00:00:00Z", Format::Rfc3339, v, &err));
  EXPECT_FALSE(parse_value("2024-01-01X00:00:00Z", Format::Rfc3339, v, &err));
  EXPECT_FALSE(parse_value("2024-01-01T00:00:00+0200", Format::Rfc3339, v, &err));
  EXPECT_FALSE(parse_value("2024-01-01T00:00:00.Z", Format::Rfc3339, v, &err));
  EXPECT_FALSE(parse_value("2024-01-01T00:00:00Z trailing", Format::Rfc3339, v, &err));
  EXPECT_FALSE(parse_value("1704067200", Format::Rfc3339, v, &err));
}
