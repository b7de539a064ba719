#include "gapscan/types.hpp"

namespace gapscan {

bool is_time_format(Format format) {
  return format == Format::Unix || format == Format::UnixMs || format == Format::Rfc3339;
}

const char* format_name(Format format) {
  switch (format) {
    case Format::UInt: return "uint";
    case Format::Int: return "int";
    case Format::Unix: return "unix";
    case Format::UnixMs: return "unix_ms";
    case Format::Rfc3339: return "rfc-3339";
  }
  return "unknown";
}

const char* relation_name(Relation relation) {
  switch (relation) {
    case Relation::Greater: return "gt";
    case Relation::GreaterOrEqual: return "ge";
    case Relation::Less: return "lt";
    case Relation::LessOrEqual: return "le";
  }
  return "unknown";
}

const char* line_error_name(LineError error) {
  switch (error) {
    case LineError::None: return "None";
    case LineError::EmptyLine: return "EmptyLine";
    case LineError::MissingField: return "MissingField";
    case LineError::EmptyField: return "EmptyField";
    case LineError::FormatError: return "FormatError";
  }
  return "Unknown";
}

} // namespace gapscan
