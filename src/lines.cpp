#include "normhash/lines.hpp"

#include "normhash/error.hpp"

#include <algorithm>

namespace normhash {

LineSplitter::LineSplitter(std::istream &in, std::size_t chunk_size)
    : in_(in), chunk_size_(std::max<std::size_t>(chunk_size, 1)) {}

bool LineSplitter::fill() {
  if (eof_) {
    return false;
  }
  buf_.resize(chunk_size_);
  in_.read(buf_.data(), static_cast<std::streamsize>(chunk_size_));
  if (in_.bad()) {
    throw input_error("read failed");
  }
  const auto got = static_cast<std::size_t>(in_.gcount());
  if (got < chunk_size_) {
    eof_ = true;
  }
  buf_.resize(got);
  pos_ = 0;
  return got > 0;
}

bool LineSplitter::next(std::string &line) {
  line.clear();
  bool any = false; // consumed at least one byte for this line
  for (;;) {
    if (pos_ == buf_.size() && !fill()) {
      return any;
    }
    any = true;
    const auto nl = buf_.find(consts::kLF, pos_);
    if (nl == std::string::npos) {
      line.append(buf_, pos_, std::string::npos);
      pos_ = buf_.size();
      continue;
    }
    line.append(buf_, pos_, nl - pos_);
    pos_ = nl + 1;
    // the CR may have arrived with the previous chunk, so check the line, not the buffer
    if (!line.empty() && line.back() == consts::kCR) {
      line.pop_back();
    }
    return true;
  }
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start < text.size()) {
    const auto nl = text.find(consts::kLF, start);
    if (nl == std::string_view::npos) {
      out.emplace_back(text.substr(start));
      break;
    }
    auto end = nl;
    if (end > start && text[end - 1] == consts::kCR) {
      --end;
    }
    out.emplace_back(text.substr(start, end - start));
    start = nl + 1;
  }
  return out;
}

} // namespace normhash
