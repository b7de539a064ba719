#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

#include "gapscan/gap.hpp"
#include "gapscan/options.hpp"
#include "gapscan/output.hpp"
#include "gapscan/types.hpp"

namespace gapscan {

// Exit codes of run()
constexpr int kExitOk = 0;
constexpr int kExitHalted = 1; // invalid data line or I/O error
constexpr int kExitUsage = 2;  // bad configuration, detected before scanning

struct ScanConfig {
  std::string delimiter = ",";
  std::size_t index = 1;
  Format format = Format::UInt;
  Relation relation = Relation::Greater;
  Gap threshold;
  std::string comment = "#";
  bool allow_invalid = false;
};

enum class ScanStatus {
  Continue,
  Halted,       // invalid line without allow mode; see error()
  OutputClosed, // the reader went away, stop quietly
  OutputFailed,
};

// Feeds lines one at a time and keeps the last valid record, so a gap is
// detected across comment and skipped lines.
class Scanner {
public:
  Scanner(ScanConfig config, GapFormatter formatter, OutputSink& sink);

  ScanStatus feed(std::uint64_t line_no, const std::string& line);

  const std::optional<Record>& previous() const { return previous_; }
  std::int64_t gaps() const { return gaps_; }
  std::int64_t skipped() const { return skipped_; }

  // Set once feed() returned Halted.
  LineError error_kind() const { return error_kind_; }
  const std::string& error() const { return error_; }

private:
  ScanStatus halt(std::uint64_t line_no, LineError kind, const std::string& detail);

  ScanConfig config_;
  GapFormatter formatter_;
  OutputSink& sink_;

  std::optional<Record> previous_;
  std::int64_t gaps_ = 0;
  std::int64_t skipped_ = 0;

  LineError error_kind_ = LineError::None;
  std::string error_;
};

// Builds the scan configuration from resolved options, parsing the gap.
bool make_scan_config(const Options& opts, ScanConfig& out, std::string* error_out = nullptr);

// Opens FILE for reading. A directory or unreadable file fails here, before
// any scanning starts.
bool open_input(const std::string& path, std::ifstream& in, std::string* error_out = nullptr);

// Opens PATH for writing, truncating it. Returns nullptr on failure. The
// caller closes the file.
std::FILE* open_output(const std::string& path, std::string* error_out = nullptr);

// Scans `in` to exhaustion or the first fatal line. Diagnostics go to `err`.
int run(const Options& opts, std::istream& in, OutputSink& sink, std::ostream& err);

} // namespace gapscan
