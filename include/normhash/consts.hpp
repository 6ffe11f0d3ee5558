#pragma once
#include <cstddef>
#include <string_view>

namespace normhash::consts {

// ——— Digest sizes ———
inline constexpr std::size_t kDigestRawLen = 32; // 32 bytes (SHA-256)
inline constexpr std::size_t kDigestHexLen = 64; // 64 hex chars (SHA-256)

// ——— Normalization defaults ———
inline constexpr std::string_view kDefaultEol = "\n";

// Bytes pulled from the input per read; bounds memory independently of file size.
inline constexpr std::size_t kReadChunkSize = 64 * 1024;

// ——— Common characters ———
inline constexpr char kLF = '\n';
inline constexpr char kCR = '\r';

// ——— Program identity ———
inline constexpr std::string_view kProgramName = "normhash";
#ifdef NORMHASH_VERSION
inline constexpr std::string_view kVersion = NORMHASH_VERSION;
#else
inline constexpr std::string_view kVersion = "0.0.0";
#endif

} // namespace normhash::consts
