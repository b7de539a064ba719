#pragma once

#include <cstdint>
#include <string>

#include "gapscan/types.hpp"

namespace gapscan {

// Difference between two values, or the threshold it is compared against.
// Durations are held in milliseconds.
struct Gap {
  enum class Kind { Number, Duration };

  Kind kind = Kind::Number;
  std::int64_t amount = 0;
};

// Threshold syntax depends on the format:
//   uint, int:                 signed integer, e.g. "4" or "-10"
//   unix, unix_ms, rfc-3339:   integer followed by one of [dhms], e.g. "12h"
// For time formats the bare default "1" is read as "1h". Negative durations
// are rejected unless `allow_negative_duration` is set.
bool parse_gap(const std::string& text,
               Format format,
               bool allow_negative_duration,
               Gap& out,
               std::string* error_out = nullptr);

// current - previous. Both values must be of the same kind. Saturates at the
// int64 limits instead of overflowing.
Gap value_delta(const Value& previous, const Value& current);

// delta <relation> threshold. Gaps of different kinds never match.
bool gap_matches(Relation relation, const Gap& delta, const Gap& threshold);

} // namespace gapscan
