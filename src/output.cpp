#include "gapscan/output.hpp"

#include <cerrno>
#include <cstdio>
#include <string>

namespace gapscan {

WriteStatus StreamSink::write_line(const std::string& line) {
  os_ << line << '\n';
  return os_ ? WriteStatus::Ok : WriteStatus::Failed;
}

WriteStatus StreamSink::flush() {
  os_.flush();
  return os_ ? WriteStatus::Ok : WriteStatus::Failed;
}

WriteStatus FileSink::status_from_errno() const {
  return errno == EPIPE ? WriteStatus::Closed : WriteStatus::Failed;
}

WriteStatus FileSink::write_line(const std::string& line) {
  errno = 0;
  if (std::fwrite(line.data(), 1, line.size(), file_) != line.size() ||
      std::fputc('\n', file_) == EOF) {
    return status_from_errno();
  }
  return WriteStatus::Ok;
}

WriteStatus FileSink::flush() {
  errno = 0;
  if (std::fflush(file_) == EOF) return status_from_errno();
  return WriteStatus::Ok;
}

WriteStatus GapFormatter::emit(const Record& previous, const Record& current, OutputSink& sink) {
  WriteStatus st = WriteStatus::Ok;

  if (mode_ == OutputMode::Diff) {
    st = sink.write_line(previous.field + delimiter_ + current.field);
  } else {
    if (emitted_ > 0) st = sink.write_line(std::string());
    if (st == WriteStatus::Ok) st = sink.write_line(previous.line);
    if (st == WriteStatus::Ok) st = sink.write_line(current.line);
  }

  if (st == WriteStatus::Ok) ++emitted_;
  return st;
}

} // namespace gapscan
