#pragma once

#include <cstdint>
#include <string>

#include "gapscan/types.hpp"

namespace gapscan {

// Accepts "uint", "int", "unix", "unix_ms" and "rfc-3339".
bool parse_format(const std::string& name, Format& out);

// Parses one field according to `format`. Surrounding whitespace and a pair
// of enclosing double quotes are ignored. On failure `error_out` receives a
// short reason (the caller reports it as a FormatError).
bool parse_value(const std::string& field,
                 Format format,
                 Value& out,
                 std::string* error_out = nullptr);

// Base-10 signed 64-bit integer with an optional '+' or '-' sign.
bool parse_int64(const std::string& text, std::int64_t& out, std::string* error_out = nullptr);

// RFC 3339 timestamp to milliseconds since the epoch, offset applied.
// Fractional seconds beyond milliseconds are truncated.
bool parse_rfc3339(const std::string& text, std::int64_t& epoch_ms, std::string* error_out = nullptr);

} // namespace gapscan
