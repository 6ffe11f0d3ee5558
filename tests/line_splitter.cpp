#include "normhash/error.hpp"
#include "normhash/lines.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <vector>

using Lines = std::vector<std::string>;

static Lines drain(const std::string &input, std::size_t chunk) {
  std::istringstream iss(input);
  normhash::LineSplitter splitter{iss, chunk};
  Lines out;
  std::string line;
  while (splitter.next(line)) {
    out.push_back(line);
  }
  return out;
}

static std::string show(const Lines &ls) {
  std::string s = "[";
  for (const auto &l : ls) {
    s += "\"";
    for (char c : l) {
      if (c == '\r')
        s += "\\r";
      else if (c == '\n')
        s += "\\n";
      else
        s += c;
    }
    s += "\" ";
  }
  return s + "]";
}

// Streambuf whose reads always fail, to drive the istream into badbit.
struct FailingBuf : std::streambuf {
  int_type underflow() override { throw std::runtime_error("device error"); }
};

int main() {
  struct Case {
    std::string input;
    Lines expected;
  };
  const std::vector<Case> cases = {
      {"", {}},
      {"a", {"a"}},
      {"a\n", {"a"}},
      {"a\r\n", {"a"}},
      {"a\r\nb", {"a", "b"}},
      {"line1\r\nline2\n", {"line1", "line2"}},
      {"\n", {""}},
      {"\r\n", {""}},
      {"\n\n", {"", ""}},
      {"a\n\r\nb\n", {"a", "", "b"}},
      {"a\rb\n", {"a\rb"}},            // bare CR is content
      {"a\r", {"a\r"}},                // trailing bare CR kept
      {"a\r\r\n", {"a\r"}},            // only the CR next to LF belongs to the boundary
      {"\r", {"\r"}},
      {std::string("\xff\0z\n", 4), {std::string("\xff\0z", 3)}}, // opaque bytes
  };

  // Small chunk sizes force CRLF pairs and lines to straddle read boundaries.
  for (const std::size_t chunk : {std::size_t{1}, std::size_t{2}, std::size_t{3}, std::size_t{4096}}) {
    for (const auto &c : cases) {
      const Lines got = drain(c.input, chunk);
      if (got != c.expected) {
        std::cerr << "chunk " << chunk << ": input " << show({c.input}) << " gave " << show(got)
                  << ", expected " << show(c.expected) << "\n";
        return 1;
      }
    }
  }

  // In-memory splitting follows the same rules.
  for (const auto &c : cases) {
    if (normhash::split_lines(c.input) != c.expected) {
      std::cerr << "split_lines mismatch for " << show({c.input}) << "\n";
      return 1;
    }
  }

  // Exhausted splitter keeps reporting end of input.
  {
    std::istringstream iss("x\n");
    normhash::LineSplitter splitter{iss};
    std::string line;
    if (!splitter.next(line) || line != "x") {
      std::cerr << "expected first line\n";
      return 1;
    }
    if (splitter.next(line) || splitter.next(line)) {
      std::cerr << "splitter yielded past end\n";
      return 1;
    }
  }

  // A failing device surfaces as input_error.
  {
    FailingBuf buf;
    std::istream in(&buf);
    normhash::LineSplitter splitter{in};
    std::string line;
    bool threw = false;
    try {
      (void)splitter.next(line);
    } catch (const normhash::input_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "read failure did not raise input_error\n";
      return 1;
    }
  }

  std::cout << "OK\n";
  return 0;
}
