#pragma once
#include "normhash/normalize.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace normhash {

/**
 * Line-ending-agnostic file hasher.
 *
 * Reads the input line by line, re-joins the lines with the configured eol and
 * returns the lowercase hex SHA-256 of the result. The same content stored with
 * LF or CRLF line endings hashes identically.
 *
 * Example:
 *   auto hex = normhash::Hasher{}.with_eol("\r\n").with_no_eof(true).hash_file("in.txt");
 */
class Hasher {
public:
  Hasher() = default;
  explicit Hasher(Options opts) : opts_(std::move(opts)) {}

  // Fluent setters return a modified copy; the original is left untouched.
  [[nodiscard]] auto with_eol(std::string eol) const -> Hasher;
  [[nodiscard]] auto with_no_eof(bool no_eof) const -> Hasher;
  [[nodiscard]] auto with_ignore_whitespaces(bool ignore) const -> Hasher;

  [[nodiscard]] const Options &options() const { return opts_; }

  // Hash everything readable from `in`. If `out` is set, the normalized bytes
  // are written there as they are hashed.
  [[nodiscard]] auto hash_stream(std::istream &in, std::ostream *out = nullptr) const
      -> std::string;

  // Hash the file at `in`, optionally writing the normalized bytes to `out`
  // (created or truncated; its parent directory must already exist).
  // Throws input_error / output_error on I/O failure.
  [[nodiscard]] auto hash_file(const std::filesystem::path &in,
                               const std::optional<std::filesystem::path> &out = std::nullopt) const
      -> std::string;

private:
  Options opts_;
};

// Shorthand for Hasher{opts}.hash_file(in, out).
std::string hash_file(const std::filesystem::path &in,
                      const std::optional<std::filesystem::path> &out, const Options &opts = {});

} // namespace normhash
