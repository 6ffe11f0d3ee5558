#pragma once
#include "normhash/normalize.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace normhash::cli {

struct ParsedArgs {
  Options opts;
  std::string file_in;
  std::optional<std::string> file_out;
  bool help = false;
  bool version = false;
  std::string error; // non-empty on a usage error
};

// Parse argv (argv[0] is the program name). Never throws on bad input;
// problems are reported through ParsedArgs::error.
ParsedArgs parse_args(int argc, char **argv);

void print_usage(std::ostream &os);

// Whole CLI: parse, hash, print. Returns the process exit code:
// 0 success, 1 I/O failure, 2 usage error.
int run(int argc, char **argv, std::ostream &out, std::ostream &err);

} // namespace normhash::cli
