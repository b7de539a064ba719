#pragma once

#include <cstdint>
#include <cstdio>
#include <ostream>
#include <string>
#include <utility>

#include "gapscan/types.hpp"

namespace gapscan {

enum class WriteStatus {
  Ok,
  Closed, // the reader went away (broken pipe); not an error
  Failed,
};

class OutputSink {
public:
  virtual ~OutputSink() = default;

  virtual WriteStatus write_line(const std::string& line) = 0;
  virtual WriteStatus flush() = 0;
};

// Writes to a std::ostream (files opened with --out, tests).
class StreamSink : public OutputSink {
public:
  explicit StreamSink(std::ostream& os) : os_(os) {}

  WriteStatus write_line(const std::string& line) override;
  WriteStatus flush() override;

private:
  std::ostream& os_;
};

// Writes to a stdio stream. A write that fails with EPIPE reports Closed;
// SIGPIPE must be ignored for that to surface.
class FileSink : public OutputSink {
public:
  explicit FileSink(std::FILE* file) : file_(file) {}

  WriteStatus write_line(const std::string& line) override;
  WriteStatus flush() override;

private:
  WriteStatus status_from_errno() const;

  std::FILE* file_;
};

enum class OutputMode {
  Diff,   // "<previous field><delim><current field>"
  Filter, // both raw lines, pairs separated by an empty line
};

class GapFormatter {
public:
  GapFormatter(OutputMode mode, std::string delimiter)
      : mode_(mode), delimiter_(std::move(delimiter)) {}

  WriteStatus emit(const Record& previous, const Record& current, OutputSink& sink);

  std::int64_t emitted() const { return emitted_; }

private:
  OutputMode mode_;
  std::string delimiter_;
  std::int64_t emitted_ = 0;
};

} // namespace gapscan
