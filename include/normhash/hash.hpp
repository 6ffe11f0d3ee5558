#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

// Forward declaration, keeps <openssl/evp.h> out of the public headers
struct evp_md_ctx_st;

namespace normhash {

// Raw 32-byte SHA-256 digest (binary, not hex)
using digest = std::array<std::uint8_t, 32>;

/**
 * Streaming SHA-256 accumulator backed by the OpenSSL EVP API.
 * Feed any number of chunks with update(), then call finish() once.
 * Throws std::runtime_error if OpenSSL refuses an operation.
 */
class Sha256 {
public:
  Sha256();

  void update(std::span<const std::uint8_t> data);
  void update(std::string_view data);

  // Finalize the accumulator. The object must not be updated afterwards.
  [[nodiscard]] auto finish() -> digest;

private:
  std::unique_ptr<evp_md_ctx_st, void (*)(evp_md_ctx_st *)> ctx_;
  bool finished_ = false;
};

/** Compute SHA-256 of arbitrary bytes in one call. */
digest sha256(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha256(std::string_view s) {
  return sha256(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert binary digest to 64-char lowercase hex. */
std::string to_hex(const digest &d);

/**
 * Parse 64-char hex into binary digest.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, digest &out);

} // namespace normhash
