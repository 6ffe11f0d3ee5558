#include "normhash/hasher.hpp"

#include "normhash/error.hpp"
#include "normhash/lines.hpp"
#include "normhash/sink.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace normhash {

Hasher Hasher::with_eol(std::string eol) const {
  Hasher h{*this};
  h.opts_.eol = std::move(eol);
  return h;
}

Hasher Hasher::with_no_eof(bool no_eof) const {
  Hasher h{*this};
  h.opts_.no_eof = no_eof;
  return h;
}

Hasher Hasher::with_ignore_whitespaces(bool ignore) const {
  Hasher h{*this};
  h.opts_.ignore_whitespaces = ignore;
  return h;
}

std::string Hasher::hash_stream(std::istream &in, std::ostream *out) const {
  HashSink sink{out};
  Reassembler joiner{opts_, [&sink](std::string_view chunk) { sink.write(chunk); }};
  LineSplitter splitter{in};

  std::string line;
  while (splitter.next(line)) {
    joiner.line(line);
  }
  joiner.finish();
  return sink.finish();
}

std::string Hasher::hash_file(const std::filesystem::path &in,
                              const std::optional<std::filesystem::path> &out) const {
  std::error_code ec;
  if (std::filesystem::is_directory(in, ec)) {
    throw input_error("is a directory: " + in.string());
  }
  std::ifstream ifs(in, std::ios::binary);
  if (!ifs) {
    throw input_error("open for read failed: " + in.string());
  }

  // output is only touched once the input is known to be readable
  std::ofstream ofs;
  if (out) {
    ofs.open(*out, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw output_error("open for write failed: " + out->string());
    }
  }

  try {
    return hash_stream(ifs, out ? &ofs : nullptr);
  } catch (const input_error &e) {
    throw input_error(std::string(e.what()) + ": " + in.string());
  } catch (const output_error &e) {
    throw output_error(std::string(e.what()) + ": " + out->string());
  }
}

std::string hash_file(const std::filesystem::path &in,
                      const std::optional<std::filesystem::path> &out, const Options &opts) {
  return Hasher{opts}.hash_file(in, out);
}

} // namespace normhash
