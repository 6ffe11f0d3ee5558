#pragma once
#include "normhash/consts.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace normhash {

// Normalization settings. Built once per run, never mutated afterwards.
struct Options {
  std::string eol{consts::kDefaultEol}; // appended after each line; any bytes, may be empty
  bool no_eof = false;                  // drop the eol after the last line
  bool ignore_whitespaces = false;      // strip whitespace bytes from line content
};

// Whitespace bytes removed by ignore_whitespaces: space, \t, \n, \v, \f, \r.
[[nodiscard]] bool is_whitespace(char c);

// Remove every whitespace byte from `line` in place.
void strip_whitespace(std::string &line);

/**
 * Turns a sequence of lines into the normalized byte stream.
 *
 * The eol belonging to line N is emitted when line N+1 arrives or in finish(),
 * so the last one can be dropped for no_eof without lookahead on the input.
 * Zero lines produce no output at all. Stripping never touches the eol itself.
 */
class Reassembler {
public:
  using Emit = std::function<void(std::string_view)>;

  Reassembler(const Options &opts, Emit emit);

  // Feed the next line (content without terminator).
  void line(std::string_view content);

  // Close the stream; emits the trailing eol unless no_eof.
  void finish();

  [[nodiscard]] auto line_count() const -> std::size_t { return count_; }

private:
  Options opts_;
  Emit emit_;
  std::string scratch_;
  std::size_t count_ = 0;
  bool finished_ = false;
};

// Normalize in-memory text in one call.
std::string normalize(std::string_view text, const Options &opts);

} // namespace normhash
