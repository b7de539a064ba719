#pragma once

#include <cstddef>
#include <string>

#include "gapscan/types.hpp"

namespace gapscan {

enum class LineKind {
  Comment,
  Empty,
  Candidate,
};

// Removes a trailing '\r' left over from CRLF input.
void strip_line_terminator(std::string& line);

// Comment detection is an exact prefix match; an empty marker disables it.
LineKind classify_line(const std::string& line, const std::string& comment);

// Selects the 1-based `index`-th field. The delimiter is literal and may be
// longer than one character; an empty delimiter makes the whole line field 1.
// Fails with MissingField or EmptyField.
bool extract_field(const std::string& line,
                   const std::string& delimiter,
                   std::size_t index,
                   std::string& field,
                   LineError* error_out = nullptr);

// Shortens `text` to at most `max_len` characters plus "..." for diagnostics.
std::string preview(const std::string& text, std::size_t max_len);

} // namespace gapscan
