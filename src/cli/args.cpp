#include "cli/args.hpp"

#include "normhash/consts.hpp"
#include "normhash/hasher.hpp"

#include <exception>
#include <filesystem>
#include <string_view>
#include <vector>

namespace normhash::cli {

ParsedArgs parse_args(int argc, char **argv) {
  ParsedArgs out;
  std::vector<std::string> positionals;
  bool only_positionals = false;

  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];
    if (only_positionals || a.size() < 2 || a.front() != '-') {
      positionals.emplace_back(a);
      continue;
    }
    if (a == "--") {
      only_positionals = true;
    } else if (a == "-h" || a == "--help") {
      out.help = true;
    } else if (a == "-V" || a == "--version") {
      out.version = true;
    } else if (a == "--no-eof") {
      out.opts.no_eof = true;
    } else if (a == "--ignore-whitespaces") {
      out.opts.ignore_whitespaces = true;
    } else if (a == "--eol") {
      if (i + 1 >= argc) {
        out.error = "option '--eol' requires a value";
        return out;
      }
      out.opts.eol = argv[++i];
    } else if (a.starts_with("--eol=")) {
      out.opts.eol = std::string(a.substr(6));
    } else {
      out.error = "unexpected argument '" + std::string(a) + "'";
      return out;
    }
  }

  if (out.help || out.version) {
    return out;
  }
  if (positionals.empty()) {
    out.error = "missing required argument <FILE_IN>";
  } else if (positionals.size() > 2) {
    out.error = "unexpected argument '" + positionals[2] + "'";
  } else {
    out.file_in = positionals[0];
    if (positionals.size() == 2) {
      out.file_out = positionals[1];
    }
  }
  return out;
}

void print_usage(std::ostream &os) {
  os << "Create cross-platform hashes of text files.\n\n";
  os << "usage: " << consts::kProgramName << " [OPTIONS] <FILE_IN> [FILE_OUT]\n\n";
  os << "arguments:\n";
  os << "  <FILE_IN>              File to be hashed\n";
  os << "  [FILE_OUT]             Optional file path to write normalized input into\n\n";
  os << "options:\n";
  os << "      --eol <EOL>        End-of-line sequence appended to each line [default: LF]\n";
  os << "      --no-eof           Skip the end-of-line after the last line\n";
  os << "      --ignore-whitespaces\n";
  os << "                         Remove all whitespace from lines before hashing\n";
  os << "  -h, --help             Print help\n";
  os << "  -V, --version          Print version\n";
}

int run(int argc, char **argv, std::ostream &out, std::ostream &err) {
  const ParsedArgs args = parse_args(argc, argv);
  if (!args.error.empty()) {
    err << consts::kProgramName << ": " << args.error << "\n\n";
    print_usage(err);
    return 2;
  }
  if (args.help) {
    print_usage(out);
    return 0;
  }
  if (args.version) {
    out << consts::kProgramName << " " << consts::kVersion << "\n";
    return 0;
  }

  std::optional<std::filesystem::path> file_out;
  if (args.file_out) {
    file_out = *args.file_out;
  }
  try {
    out << hash_file(args.file_in, file_out, args.opts) << "\n";
    return 0;
  } catch (const std::exception &e) {
    err << consts::kProgramName << ": " << e.what() << "\n";
    return 1;
  }
}

} // namespace normhash::cli
