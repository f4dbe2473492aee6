#include "stylegate/core/hashing.h"

#include <array>
#include <charconv>

namespace stylegate::core {

std::string stable_hash64_hex(const std::string_view input) {
  std::array<char, 16> digits{};
  const auto [end, ec] =
      std::to_chars(digits.data(), digits.data() + digits.size(), stable_hash64(input), 16);
  const auto written = static_cast<std::size_t>(end - digits.data());

  std::string hex(digits.size() - written, '0');
  hex.append(digits.data(), written);
  return hex;
}

}  // namespace stylegate::core
