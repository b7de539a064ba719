#include "gapscan/value.hpp"

#include <charconv>
#include <cctype>
#include <cstdint>
#include <ctime> // timegm()
#include <limits>
#include <string>
#include <system_error>

namespace gapscan {

static std::string strip_field(const std::string& field) {
  size_t start = 0;
  while (start < field.size() && std::isspace(static_cast<unsigned char>(field[start]))) ++start;
  size_t end = field.size();
  while (end > start && std::isspace(static_cast<unsigned char>(field[end - 1]))) --end;

  // "123" -> 123
  if (end - start >= 2 && field[start] == '"' && field[end - 1] == '"') {
    ++start;
    --end;
  }
  return field.substr(start, end - start);
}

template <typename T>
static bool parse_integer(const std::string& s, bool allow_plus, T& out, std::string* error_out) {
  if (s.empty()) {
    if (error_out) *error_out = "cannot parse integer from empty string";
    return false;
  }

  const char* first = s.data();
  const char* last = s.data() + s.size();

  // from_chars() accepts '-' for signed types but never '+'
  if (allow_plus && *first == '+' && first + 1 < last &&
      std::isdigit(static_cast<unsigned char>(first[1]))) {
    ++first;
  }

  T v = 0;
  auto res = std::from_chars(first, last, v, 10);
  if (res.ec == std::errc::result_out_of_range) {
    if (error_out) *error_out = "number out of range";
    return false;
  }
  if (res.ec != std::errc() || res.ptr != last) {
    if (error_out) *error_out = "invalid digit found in string";
    return false;
  }

  out = v;
  return true;
}

static bool read_digits(const std::string& s, size_t& pos, size_t count, int& out) {
  if (pos + count > s.size()) return false;

  int v = 0;
  for (size_t i = 0; i < count; ++i) {
    const char c = s[pos + i];
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  pos += count;
  out = v;
  return true;
}

static bool expect_char(const std::string& s, size_t& pos, char c) {
  if (pos >= s.size() || s[pos] != c) return false;
  ++pos;
  return true;
}

static int days_in_month(int year, int month) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  if (month == 2 && leap) return 29;
  return days[month - 1];
}

bool parse_format(const std::string& name, Format& out) {
  if (name == "uint") out = Format::UInt;
  else if (name == "int") out = Format::Int;
  else if (name == "unix") out = Format::Unix;
  else if (name == "unix_ms") out = Format::UnixMs;
  else if (name == "rfc-3339") out = Format::Rfc3339;
  else return false;
  return true;
}

bool parse_int64(const std::string& text, std::int64_t& out, std::string* error_out) {
  return parse_integer(text, true, out, error_out);
}

bool parse_rfc3339(const std::string& text, std::int64_t& epoch_ms, std::string* error_out) {
  auto fail = [&](const char* what) {
    if (error_out) *error_out = what;
    return false;
  };

  size_t pos = 0;
  int year = 0, month = 0, day = 0;
  int hour = 0, minute = 0, second = 0;

  if (!read_digits(text, pos, 4, year) || !expect_char(text, pos, '-') ||
      !read_digits(text, pos, 2, month) || !expect_char(text, pos, '-') ||
      !read_digits(text, pos, 2, day)) {
    return fail("invalid date, expected yyyy-mm-dd");
  }

  if (pos >= text.size()) return fail("premature end of input");
  const char sep = text[pos];
  if (sep != 'T' && sep != 't' && sep != ' ' && sep != '_') {
    return fail("invalid date and time separator");
  }
  ++pos;

  if (!read_digits(text, pos, 2, hour) || !expect_char(text, pos, ':') ||
      !read_digits(text, pos, 2, minute) || !expect_char(text, pos, ':') ||
      !read_digits(text, pos, 2, second)) {
    return fail("invalid time, expected HH:MM:SS");
  }

  if (month < 1 || month > 12) return fail("month out of range");
  if (day < 1 || day > days_in_month(year, month)) return fail("day out of range");
  if (hour > 23 || minute > 59 || second > 60) return fail("time out of range");

  int millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    size_t digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 3) millis = millis * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0) return fail("missing fractional seconds");
    for (; digits < 3; ++digits) millis *= 10;
  }

  if (pos >= text.size()) return fail("missing UTC offset");

  int offset_sec = 0;
  const char zone = text[pos];
  if (zone == 'Z' || zone == 'z') {
    ++pos;
  } else if (zone == '+' || zone == '-') {
    ++pos;
    int off_h = 0, off_m = 0;
    if (!read_digits(text, pos, 2, off_h) || !expect_char(text, pos, ':') ||
        !read_digits(text, pos, 2, off_m)) {
      return fail("invalid UTC offset");
    }
    if (off_h > 23 || off_m > 59) return fail("UTC offset out of range");
    offset_sec = off_h * 3600 + off_m * 60;
    if (zone == '-') offset_sec = -offset_sec;
  } else {
    return fail("invalid UTC offset");
  }

  if (pos != text.size()) return fail("trailing input");

  // Fields are range-checked above; timegm() folds a leap second into the
  // next minute.
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  const std::time_t t = timegm(&tm);

  epoch_ms = (static_cast<std::int64_t>(t) - offset_sec) * 1000 + millis;
  return true;
}

bool parse_value(const std::string& field, Format format, Value& out, std::string* error_out) {
  const std::string s = strip_field(field);

  switch (format) {
    case Format::UInt: {
      std::uint64_t u = 0;
      if (!parse_integer(s, false, u, error_out)) return false;
      // Gaps are computed as signed 64-bit differences.
      if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        if (error_out) *error_out = "number too large (> 2^63-1)";
        return false;
      }
      out = Value{};
      out.kind = Value::Kind::Unsigned;
      out.unsigned_value = u;
      return true;
    }

    case Format::Int: {
      std::int64_t i = 0;
      if (!parse_integer(s, true, i, error_out)) return false;
      out = Value{};
      out.kind = Value::Kind::Signed;
      out.signed_value = i;
      return true;
    }

    case Format::Unix: {
      std::int64_t secs = 0;
      if (!parse_integer(s, true, secs, error_out)) return false;
      const std::int64_t limit = std::numeric_limits<std::int64_t>::max() / 1000;
      if (secs > limit || secs < -limit) {
        if (error_out) *error_out = "timestamp out of range";
        return false;
      }
      out = Value{};
      out.kind = Value::Kind::Instant;
      out.epoch_ms = secs * 1000;
      return true;
    }

    case Format::UnixMs: {
      std::int64_t ms = 0;
      if (!parse_integer(s, true, ms, error_out)) return false;
      out = Value{};
      out.kind = Value::Kind::Instant;
      out.epoch_ms = ms;
      return true;
    }

    case Format::Rfc3339: {
      std::int64_t ms = 0;
      if (!parse_rfc3339(s, ms, error_out)) return false;
      out = Value{};
      out.kind = Value::Kind::Instant;
      out.epoch_ms = ms;
      return true;
    }
  }

  if (error_out) *error_out = "unsupported format";
  return false;
}

} // namespace gapscan
