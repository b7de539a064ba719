#include <cerrno>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

#include "gapscan/options.hpp"
#include "gapscan/output.hpp"
#include "gapscan/scanner.hpp"

int main(int argc, char** argv) {
  // A closed pipe shows up as EPIPE from the write instead of killing us.
  std::signal(SIGPIPE, SIG_IGN);
  std::ios::sync_with_stdio(false);

  gapscan::Options opts;
  std::string err;

  switch (gapscan::parse_options(argc, argv, opts, &err)) {
    case gapscan::OptionsResult::Help:
      gapscan::print_usage(std::cout);
      return gapscan::kExitOk;
    case gapscan::OptionsResult::Version:
      std::cout << "gapscan v" << gapscan::kVersion << "\n";
      return gapscan::kExitOk;
    case gapscan::OptionsResult::Error:
      std::cerr << "Error: " << err << "\n\n";
      gapscan::print_usage(std::cerr);
      return gapscan::kExitUsage;
    case gapscan::OptionsResult::Run:
      break;
  }

  // Decide input stream
  std::ifstream fin;
  std::istream* in = &std::cin;

  if (opts.path != "-") {
    if (!gapscan::open_input(opts.path, fin, &err)) {
      std::cerr << "Error: " << err << "\n";
      return gapscan::kExitUsage;
    }
    in = &fin;
  }

  // Decide output stream
  if (!opts.out_path.empty()) {
    std::FILE* fout = gapscan::open_output(opts.out_path, &err);
    if (!fout) {
      std::cerr << "Error: " << err << "\n";
      return gapscan::kExitUsage;
    }
    gapscan::FileSink sink(fout);
    int code = gapscan::run(opts, *in, sink, std::cerr);
    errno = 0;
    if (std::fclose(fout) != 0 && code == gapscan::kExitOk && errno != EPIPE) {
      std::cerr << "Error: failed to write output\n";
      code = gapscan::kExitHalted;
    }
    return code;
  }

  gapscan::FileSink sink(stdout);
  return gapscan::run(opts, *in, sink, std::cerr);
}
