#pragma once

#include <cstdint>
#include <string>

namespace gapscan {

// Format of the selected field. Fixed for the whole run.
enum class Format {
  UInt,
  Int,
  Unix,
  UnixMs,
  Rfc3339,
};

enum class Relation {
  Greater,
  GreaterOrEqual,
  Less,
  LessOrEqual,
};

// Per-line data errors. Fatal unless invalid lines are allowed.
enum class LineError {
  None,
  EmptyLine,
  MissingField, // field index beyond the fields on the line
  EmptyField,
  FormatError,
};

// One parsed field value. Only the member matching `kind` is meaningful.
struct Value {
  enum class Kind { Unsigned, Signed, Instant };

  Kind kind = Kind::Signed;
  std::uint64_t unsigned_value = 0;
  std::int64_t signed_value = 0;
  std::int64_t epoch_ms = 0; // Instant: milliseconds since the Unix epoch
};

// A valid data line, kept as "previous" until the next valid one arrives.
struct Record {
  std::uint64_t line_no = 0;
  Value value;
  std::string field; // selected field, as written
  std::string line;  // whole line, terminator stripped
};

bool is_time_format(Format format);

const char* format_name(Format format);
const char* relation_name(Relation relation);
const char* line_error_name(LineError error);

} // namespace gapscan
