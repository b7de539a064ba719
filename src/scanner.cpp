#include "gapscan/scanner.hpp"

#include <cstdio>
#include <fstream>
#include <istream>
#include <ostream>
#include <string>
#include <utility>

#include "gapscan/line.hpp"
#include "gapscan/value.hpp"

namespace gapscan {

// Field contents in diagnostics are cut to this length.
static const size_t kPreviewLen = 32;

Scanner::Scanner(ScanConfig config, GapFormatter formatter, OutputSink& sink)
    : config_(std::move(config)), formatter_(std::move(formatter)), sink_(sink) {}

ScanStatus Scanner::halt(std::uint64_t line_no, LineError kind, const std::string& detail) {
  error_kind_ = kind;
  error_ = "line " + std::to_string(line_no) + ": " + line_error_name(kind) + ": " + detail;
  return ScanStatus::Halted;
}

ScanStatus Scanner::feed(std::uint64_t line_no, const std::string& line) {
  if (error_kind_ != LineError::None) return ScanStatus::Halted;

  switch (classify_line(line, config_.comment)) {
    case LineKind::Comment:
      return ScanStatus::Continue;
    case LineKind::Empty:
      if (config_.allow_invalid) {
        ++skipped_;
        return ScanStatus::Continue;
      }
      return halt(line_no, LineError::EmptyLine, "line is empty");
    case LineKind::Candidate:
      break;
  }

  Record current;
  current.line_no = line_no;

  LineError kind = LineError::None;
  if (!extract_field(line, config_.delimiter, config_.index, current.field, &kind)) {
    if (config_.allow_invalid) {
      ++skipped_;
      return ScanStatus::Continue;
    }
    if (kind == LineError::EmptyField) {
      return halt(line_no, kind, "empty field at index " + std::to_string(config_.index));
    }
    return halt(line_no, kind, "no field could be found at index " + std::to_string(config_.index));
  }

  std::string err;
  if (!parse_value(current.field, config_.format, current.value, &err)) {
    if (config_.allow_invalid) {
      ++skipped_;
      return ScanStatus::Continue;
    }
    return halt(line_no, LineError::FormatError,
                "field '" + preview(current.field, kPreviewLen) + "' could not be parsed as " +
                    format_name(config_.format) + ": " + err);
  }

  current.line = line;

  if (previous_) {
    const Gap delta = value_delta(previous_->value, current.value);
    if (gap_matches(config_.relation, delta, config_.threshold)) {
      ++gaps_;
      const WriteStatus st = formatter_.emit(*previous_, current, sink_);
      if (st != WriteStatus::Ok) {
        previous_ = std::move(current);
        return st == WriteStatus::Closed ? ScanStatus::OutputClosed : ScanStatus::OutputFailed;
      }
    }
  }

  previous_ = std::move(current);
  return ScanStatus::Continue;
}

bool make_scan_config(const Options& opts, ScanConfig& out, std::string* error_out) {
  ScanConfig config;
  config.delimiter = opts.delimiter;
  config.index = opts.index;
  config.format = opts.format;
  config.relation = opts.relation;
  config.comment = opts.comment;
  config.allow_invalid = opts.allow_invalid;

  if (!parse_gap(opts.gap, opts.format, opts.negative_gap, config.threshold, error_out)) {
    return false;
  }

  out = config;
  return true;
}

bool open_input(const std::string& path, std::ifstream& in, std::string* error_out) {
  in.open(path);
  if (in) {
    // Opening a directory succeeds; the first read does not.
    in.peek();
    if (!in.bad()) {
      in.clear();
      return true;
    }
    in.close();
  }
  if (error_out) *error_out = "Failed to open file: " + path;
  return false;
}

std::FILE* open_output(const std::string& path, std::string* error_out) {
  std::FILE* f = std::fopen(path.c_str(), "w");
  if (!f && error_out) *error_out = "Failed to open output file: " + path;
  return f;
}

int run(const Options& opts, std::istream& in, OutputSink& sink, std::ostream& err) {
  ScanConfig config;
  std::string error;
  if (!make_scan_config(opts, config, &error)) {
    err << "Error: " << error << "\n";
    return kExitUsage;
  }

  if (opts.verbose) print_options(err, opts);

  Scanner scanner(config, GapFormatter(opts.mode, opts.output_delimiter), sink);

  std::string line;
  std::uint64_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    strip_line_terminator(line);

    switch (scanner.feed(line_no, line)) {
      case ScanStatus::Continue:
        continue;
      case ScanStatus::OutputClosed:
        return kExitOk;
      case ScanStatus::Halted:
        // Results found so far still go out before the diagnostic.
        if (sink.flush() == WriteStatus::Failed) {
          err << "Error: failed to write output\n";
        }
        err << "Error: " << scanner.error() << "\n";
        return kExitHalted;
      case ScanStatus::OutputFailed:
        err << "Error: failed to write output at line " << line_no << "\n";
        return kExitHalted;
    }
  }

  if (in.bad()) {
    err << "Error: failed to read input after line " << line_no << "\n";
    return kExitHalted;
  }

  if (sink.flush() == WriteStatus::Failed) {
    err << "Error: failed to write output\n";
    return kExitHalted;
  }

  if (opts.verbose) {
    err << "  lines: " << line_no << ", gaps: " << scanner.gaps()
        << ", skipped: " << scanner.skipped() << "\n";
  }
  return kExitOk;
}

} // namespace gapscan
