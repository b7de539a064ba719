#include "gapscan/options.hpp"

#include <charconv>
#include <cstdint>
#include <ostream>
#include <string>
#include <system_error>

#include "gapscan/value.hpp"

namespace gapscan {

const char* const kVersion = "0.3";

static bool parse_index(const std::string& s, std::size_t& out) {
  std::uint64_t v = 0;
  const char* last = s.data() + s.size();
  auto res = std::from_chars(s.data(), last, v, 10);
  if (res.ec != std::errc() || res.ptr != last) return false;
  if (v < 1 || v > 65535) return false;
  out = static_cast<std::size_t>(v);
  return true;
}

static bool takes_value(const std::string& a) {
  return a == "-d" || a == "-i" || a == "-f" || a == "-c" || a == "-o" || a == "--out" ||
         a == "--gt" || a == "--ge" || a == "--lt" || a == "--le";
}

// -D and --diff take the next argument as output delimiter only when it does
// not look like an option and FILE still follows it.
static bool diff_value_follows(int argc, const char* const* argv, int i) {
  if (i + 2 >= argc) return false;
  const std::string next = argv[i + 1];
  return next.empty() || next[0] != '-';
}

static std::string quoted(const std::string& s) {
  std::string out = "\"";
  for (char c : s) {
    if (c == '\t') out += "\\t";
    else out += c;
  }
  return out + "\"";
}

std::string unescape_delimiter(const std::string& s) {
  if (s == "\\t") return "\t";
  return s;
}

void print_usage(std::ostream& os) {
  os << "Usage:\n"
     << "  gapscan [options] FILE\n"
     << "  gapscan --help\n"
     << "  gapscan --version\n"
     << "\n"
     << "Reports gaps between the values of one field in subsequent lines.\n"
     << "FILE is a delimiter separated text file, or - for standard input.\n"
     << "\n"
     << "Options:\n"
     << "  -d DELIM          Input delimiter, may be longer than one character (default ,).\n"
     << "                    \\t means TAB. Empty turns off field separation.\n"
     << "  -i INDEX          Field index, starting from 1 (default 1).\n"
     << "  -f FORMAT         Field format (default uint):\n"
     << "                      uint      unsigned integer\n"
     << "                      int       signed integer\n"
     << "                      unix      seconds since the Unix epoch\n"
     << "                      unix_ms   milliseconds since the Unix epoch\n"
     << "                      rfc-3339  timestamp like yyyy-mm-ddTHH:MM:SSZ\n"
     << "  --gt GAP          Report gaps greater than GAP (default).\n"
     << "  --ge GAP          Report gaps greater than or equal to GAP.\n"
     << "  --lt GAP          Report gaps less than GAP.\n"
     << "  --le GAP          Report gaps less than or equal to GAP.\n"
     << "                    GAP is a signed integer for uint and int (default 1),\n"
     << "                    or an integer followed by one of d, h, m, s for\n"
     << "                    timestamps, like 12h (default 1h).\n"
     << "  --negative-gap    Accept negative time gaps such as -2h.\n"
     << "  -c COMMENT        Skip lines starting with COMMENT (default #). Empty disables.\n"
     << "  -a                Allow empty or invalid lines instead of stopping.\n"
     << "  -D, --diff [DELIM], --diff=DELIM\n"
     << "                    Diff mode (default): one line per gap with both values,\n"
     << "                    separated by DELIM (default: the input delimiter).\n"
     << "                    A separate DELIM must not start with '-' and needs FILE after it.\n"
     << "  -F, --filter      Filter mode: print both offending lines unchanged,\n"
     << "                    pairs separated by an empty line.\n"
     << "  -o, --out PATH    Write results to PATH instead of standard output.\n"
     << "  -v                Print the resolved configuration to standard error.\n"
     << "  -h, --help        Print this help.\n"
     << "  --version         Print version.\n"
     << "\n"
     << "Examples:\n"
     << "  gapscan -i 2 --gt 4 data.csv\n"
     << "  gapscan -f rfc-3339 --ge 12h -F readings.csv\n"
     << "  cat log.tsv | gapscan -d '\\t' -i 3 -f unix_ms --gt 5m -a -\n";
}

void print_options(std::ostream& os, const Options& opts) {
  os << "gapscan v" << kVersion << "\n"
     << "  file: " << opts.path << "\n"
     << "  delimiter: " << quoted(opts.delimiter) << "\n"
     << "  index: " << opts.index << "\n"
     << "  format: " << format_name(opts.format) << "\n"
     << "  relation: " << relation_name(opts.relation) << " " << opts.gap << "\n"
     << "  comment: " << quoted(opts.comment) << "\n"
     << "  allow invalid lines: " << (opts.allow_invalid ? "yes" : "no") << "\n"
     << "  negative time gaps: " << (opts.negative_gap ? "yes" : "no") << "\n";
  if (opts.mode == OutputMode::Diff) {
    os << "  mode: diff, delimiter " << quoted(opts.output_delimiter) << "\n";
  } else {
    os << "  mode: filter\n";
  }
  os << "  output: " << (opts.out_path.empty() ? "<stdout>" : opts.out_path) << "\n";
}

OptionsResult parse_options(int argc,
                            const char* const* argv,
                            Options& out,
                            std::string* error_out) {
  // Global flags; option values are skipped
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--help" || a == "-h") return OptionsResult::Help;
    if (a == "--version") return OptionsResult::Version;
    if (takes_value(a) || ((a == "-D" || a == "--diff") && diff_value_follows(argc, argv, i))) ++i;
  }

  auto fail = [&](const std::string& msg) {
    if (error_out) *error_out = msg;
    return OptionsResult::Error;
  };

  Options opts;
  int relations = 0;
  bool diff_given = false;
  bool filter_given = false;
  std::string odelim;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    const bool has_value = i + 1 < argc;

    if (a == "-d") {
      if (!has_value) return fail("Missing value for -d");
      opts.delimiter = unescape_delimiter(argv[++i]);
      continue;
    }

    if (a == "-i") {
      if (!has_value) return fail("Missing value for -i");
      const std::string v = argv[++i];
      if (!parse_index(v, opts.index)) {
        return fail("Invalid -i value '" + v + "' (must be an integer from 1 to 65535).");
      }
      continue;
    }

    if (a == "-f") {
      if (!has_value) return fail("Missing value for -f");
      const std::string v = argv[++i];
      if (!parse_format(v, opts.format)) {
        return fail("Invalid format '" + v + "'. Use: uint, int, unix, unix_ms or rfc-3339");
      }
      continue;
    }

    if (a == "--gt" || a == "--ge" || a == "--lt" || a == "--le") {
      if (!has_value) return fail("Missing value for " + a);
      const std::string v = argv[++i];
      if (v.empty()) return fail("Empty gap for " + a);
      if (a == "--gt") opts.relation = Relation::Greater;
      else if (a == "--ge") opts.relation = Relation::GreaterOrEqual;
      else if (a == "--lt") opts.relation = Relation::Less;
      else opts.relation = Relation::LessOrEqual;
      opts.gap = v;
      ++relations;
      continue;
    }

    if (a == "-c") {
      if (!has_value) return fail("Missing value for -c");
      opts.comment = argv[++i];
      continue;
    }

    if (a == "-a") {
      opts.allow_invalid = true;
      continue;
    }

    if (a == "--negative-gap") {
      opts.negative_gap = true;
      continue;
    }

    if (a == "-D" || a == "--diff") {
      diff_given = true;
      if (diff_value_follows(argc, argv, i)) odelim = argv[++i];
      continue;
    }

    if (a.compare(0, 7, "--diff=") == 0) {
      diff_given = true;
      odelim = a.substr(7);
      continue;
    }

    if (a == "-F" || a == "--filter") {
      filter_given = true;
      continue;
    }

    if (a == "-o" || a == "--out") {
      if (!has_value) return fail("Missing value for " + a);
      opts.out_path = argv[++i];
      if (opts.out_path.empty()) return fail("Empty path for " + a);
      continue;
    }

    if (a == "-v") {
      opts.verbose = true;
      continue;
    }

    if (a == "-" || (!a.empty() && a[0] != '-')) {
      if (!opts.path.empty()) return fail("Unexpected argument: " + a);
      opts.path = a;
      continue;
    }

    return fail("Unknown argument: " + a);
  }

  if (relations > 1) return fail("Only one of --gt, --ge, --lt, --le may be given");
  if (diff_given && filter_given) return fail("--diff and --filter cannot be used together");
  if (opts.path.empty()) return fail("Missing input FILE (use - for standard input)");
  if (opts.delimiter.empty() && opts.index != 1) {
    return fail("Supplied index and delimiter are incompatible: an empty delimiter only has field 1");
  }

  opts.mode = filter_given ? OutputMode::Filter : OutputMode::Diff;
  opts.output_delimiter = odelim.empty() ? opts.delimiter : unescape_delimiter(odelim);

  out = opts;
  return OptionsResult::Run;
}

} // namespace gapscan
