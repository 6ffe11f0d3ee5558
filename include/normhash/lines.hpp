#pragma once
#include "normhash/consts.hpp"

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace normhash {

/**
 * Lazy, single-pass splitter over a byte stream.
 *
 * A line ends at LF; a CR directly before that LF is dropped with it, so CRLF
 * counts as one boundary. A bare CR is ordinary content. A trailing fragment
 * without terminator is yielded as the last line, empty input yields nothing.
 * Bytes are not interpreted in any encoding.
 *
 * Reads at most `chunk_size` bytes at a time; memory is bounded by the chunk
 * plus the longest line.
 */
class LineSplitter {
public:
  explicit LineSplitter(std::istream &in, std::size_t chunk_size = consts::kReadChunkSize);

  // Store the next line in `line` and return true, or return false at end of input.
  // Throws input_error if the stream reports a read failure.
  bool next(std::string &line);

private:
  bool fill();

  std::istream &in_;
  std::string buf_;
  std::size_t pos_ = 0;
  std::size_t chunk_size_;
  bool eof_ = false;
};

// Split in-memory text with the same rules as LineSplitter.
std::vector<std::string> split_lines(std::string_view text);

} // namespace normhash
