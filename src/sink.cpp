#include "normhash/sink.hpp"

#include "normhash/error.hpp"

namespace normhash {

void HashSink::write(std::string_view chunk) {
  if (chunk.empty()) {
    return;
  }
  if (tee_) {
    tee_->write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    if (!*tee_) {
      throw output_error("write failed");
    }
  }
  hasher_.update(chunk);
  total_ += chunk.size();
}

std::string HashSink::finish() {
  if (tee_) {
    tee_->flush();
    if (!*tee_) {
      throw output_error("flush failed");
    }
  }
  return to_hex(hasher_.finish());
}

} // namespace normhash
