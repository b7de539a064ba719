#include "gapscan/line.hpp"

#include <string>

namespace gapscan {

void strip_line_terminator(std::string& line) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
}

LineKind classify_line(const std::string& line, const std::string& comment) {
  if (!comment.empty() && line.compare(0, comment.size(), comment) == 0) {
    return LineKind::Comment;
  }
  if (line.empty()) return LineKind::Empty;
  return LineKind::Candidate;
}

bool extract_field(const std::string& line,
                   const std::string& delimiter,
                   std::size_t index,
                   std::string& field,
                   LineError* error_out) {
  if (index == 0 || (delimiter.empty() && index != 1)) {
    if (error_out) *error_out = LineError::MissingField;
    return false;
  }

  if (delimiter.empty()) {
    field = line;
  } else {
    size_t start = 0;
    for (size_t n = 1; n < index; ++n) {
      const size_t pos = line.find(delimiter, start);
      if (pos == std::string::npos) {
        if (error_out) *error_out = LineError::MissingField;
        return false;
      }
      start = pos + delimiter.size();
    }

    const size_t end = line.find(delimiter, start);
    field = line.substr(start, end == std::string::npos ? std::string::npos : end - start);
  }

  if (field.empty()) {
    if (error_out) *error_out = LineError::EmptyField;
    return false;
  }
  return true;
}

std::string preview(const std::string& text, std::size_t max_len) {
  if (text.size() <= max_len) return text;
  return text.substr(0, max_len) + "...";
}

} // namespace gapscan
