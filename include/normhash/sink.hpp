#pragma once
#include "normhash/hash.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace normhash {

/**
 * Fan-out end of the pipeline: every chunk goes to the SHA-256 accumulator
 * and, when a tee stream is given, to that stream as well.
 * The tee receives exactly the bytes that were hashed.
 */
class HashSink {
public:
  explicit HashSink(std::ostream *tee = nullptr) : tee_(tee) {}

  // Throws output_error if the tee stream fails.
  void write(std::string_view chunk);

  // Flush the tee and return the lowercase hex digest.
  [[nodiscard]] auto finish() -> std::string;

  [[nodiscard]] auto bytes_written() const -> std::uint64_t { return total_; }

private:
  Sha256 hasher_;
  std::ostream *tee_;
  std::uint64_t total_ = 0;
};

} // namespace normhash
