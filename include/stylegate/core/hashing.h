#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace stylegate::core {

// FNV-1a 64-bit over the raw bytes of input.
constexpr std::uint64_t stable_hash64(const std::string_view input) {
  std::uint64_t hash = 14695981039346656037ull;
  for (const char ch : input) {
    hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(ch));
    hash *= 1099511628211ull;
  }
  return hash;
}

// 16 lowercase hex digits, zero padded. Used as the pipeline config fingerprint.
std::string stable_hash64_hex(std::string_view input);

}  // namespace stylegate::core
