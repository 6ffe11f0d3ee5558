#include "normhash/normalize.hpp"

#include "normhash/lines.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace normhash {

bool is_whitespace(char c) {
  switch (c) {
  case ' ':
  case '\t':
  case '\n':
  case '\v':
  case '\f':
  case '\r':
    return true;
  default:
    return false;
  }
}

void strip_whitespace(std::string &line) {
  line.erase(std::remove_if(line.begin(), line.end(), is_whitespace), line.end());
}

Reassembler::Reassembler(const Options &opts, Emit emit) : opts_(opts), emit_(std::move(emit)) {}

void Reassembler::line(std::string_view content) {
  if (finished_) {
    throw std::logic_error("Reassembler::line after finish");
  }
  if (count_ > 0 && !opts_.eol.empty()) {
    emit_(opts_.eol);
  }
  ++count_;
  if (opts_.ignore_whitespaces) {
    scratch_.assign(content);
    strip_whitespace(scratch_);
    content = scratch_;
  }
  if (!content.empty()) {
    emit_(content);
  }
}

void Reassembler::finish() {
  if (finished_) {
    return;
  }
  finished_ = true;
  if (count_ > 0 && !opts_.no_eof && !opts_.eol.empty()) {
    emit_(opts_.eol);
  }
}

std::string normalize(std::string_view text, const Options &opts) {
  std::string out;
  Reassembler r{opts, [&out](std::string_view chunk) { out.append(chunk); }};
  for (const auto &l : split_lines(text)) {
    r.line(l);
  }
  r.finish();
  return out;
}

} // namespace normhash
