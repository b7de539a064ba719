#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "gapscan/output.hpp"
#include "gapscan/types.hpp"

namespace gapscan {

extern const char* const kVersion;

// Resolved command line configuration.
struct Options {
  std::string delimiter = ",";
  std::size_t index = 1;
  Format format = Format::UInt;
  Relation relation = Relation::Greater;
  std::string gap = "1"; // parsed at startup by parse_gap()
  std::string comment = "#";
  bool allow_invalid = false;
  bool negative_gap = false;

  OutputMode mode = OutputMode::Diff;
  std::string output_delimiter = ","; // diff mode only

  std::string out_path; // empty: standard output
  bool verbose = false;
  std::string path;     // "-": standard input
};

enum class OptionsResult {
  Run,
  Help,
  Version,
  Error,
};

// "\t" (backslash, t) stands for a TAB character.
std::string unescape_delimiter(const std::string& s);

OptionsResult parse_options(int argc,
                            const char* const* argv,
                            Options& out,
                            std::string* error_out = nullptr);

void print_usage(std::ostream& os);

// Verbose header: one "name: value" line per setting.
void print_options(std::ostream& os, const Options& opts);

} // namespace gapscan
