#include "gapscan/gap.hpp"

#include <cstdint>
#include <limits>
#include <string>

#include "gapscan/value.hpp"

namespace gapscan {

static std::int64_t saturating_sub(std::int64_t a, std::int64_t b) {
  const std::int64_t max = std::numeric_limits<std::int64_t>::max();
  const std::int64_t min = std::numeric_limits<std::int64_t>::min();
  if (b < 0 && a > max + b) return max;
  if (b > 0 && a < min + b) return min;
  return a - b;
}

static bool unit_millis(char unit, std::int64_t& out) {
  switch (unit) {
    case 's': out = 1000; return true;
    case 'm': out = 60 * 1000; return true;
    case 'h': out = 60 * 60 * 1000; return true;
    case 'd': out = 24 * 60 * 60 * 1000; return true;
    default: return false;
  }
}

bool parse_gap(const std::string& text,
               Format format,
               bool allow_negative_duration,
               Gap& out,
               std::string* error_out) {
  if (!is_time_format(format)) {
    std::int64_t n = 0;
    std::string err;
    if (!parse_int64(text, n, &err)) {
      if (error_out) *error_out = "invalid numeric gap '" + text + "': " + err;
      return false;
    }
    out.kind = Gap::Kind::Number;
    out.amount = n;
    return true;
  }

  // "1" is the numeric default; for timestamps it means one hour.
  const std::string s = (text == "1") ? std::string("1h") : text;
  const std::string err_base = "invalid time gap '" + s + "'";

  if (s.empty()) {
    if (error_out) *error_out = err_base + ": empty";
    return false;
  }
  if (s.size() < 2) {
    if (error_out) *error_out = err_base + ": invalid value or time base";
    return false;
  }

  const char unit = s.back();
  std::int64_t scale = 0;
  if (!unit_millis(unit, scale)) {
    if (error_out) {
      *error_out = err_base + ": unexpected character '" + std::string(1, unit) +
                   "' (expected one of d, h, m, s)";
    }
    return false;
  }

  const std::string number = s.substr(0, s.size() - 1);
  if (number[0] == '-' && !allow_negative_duration) {
    if (error_out) *error_out = err_base + ": negative time gaps are not enabled";
    return false;
  }

  std::int64_t n = 0;
  std::string err;
  if (!parse_int64(number, n, &err)) {
    if (error_out) *error_out = err_base + ": " + err;
    return false;
  }

  if (n > std::numeric_limits<std::int64_t>::max() / scale ||
      n < std::numeric_limits<std::int64_t>::min() / scale) {
    if (error_out) *error_out = err_base + ": out of range";
    return false;
  }

  out.kind = Gap::Kind::Duration;
  out.amount = n * scale;
  return true;
}

Gap value_delta(const Value& previous, const Value& current) {
  Gap d;
  switch (current.kind) {
    case Value::Kind::Unsigned:
      // Both values are <= 2^63-1, so the difference always fits.
      d.kind = Gap::Kind::Number;
      d.amount = static_cast<std::int64_t>(current.unsigned_value) -
                 static_cast<std::int64_t>(previous.unsigned_value);
      break;
    case Value::Kind::Signed:
      d.kind = Gap::Kind::Number;
      d.amount = saturating_sub(current.signed_value, previous.signed_value);
      break;
    case Value::Kind::Instant:
      d.kind = Gap::Kind::Duration;
      d.amount = saturating_sub(current.epoch_ms, previous.epoch_ms);
      break;
  }
  return d;
}

bool gap_matches(Relation relation, const Gap& delta, const Gap& threshold) {
  if (delta.kind != threshold.kind) return false;

  switch (relation) {
    case Relation::Greater: return delta.amount > threshold.amount;
    case Relation::GreaterOrEqual: return delta.amount >= threshold.amount;
    case Relation::Less: return delta.amount < threshold.amount;
    case Relation::LessOrEqual: return delta.amount <= threshold.amount;
  }
  return false;
}

} // namespace gapscan
