#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stylegate::core {

// Deterministic ASCII-only string helpers shared by every text heuristic in the
// classifier, the rule evaluators, the soft scorer and grounding.
// - ASCII lowercasing via explicit char math (no std::tolower, no locale)
// - Non-ASCII bytes pass through unchanged
// - Output is byte-stable across platforms and compilers

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// contains_ci reports whether needle occurs in haystack, ignoring ASCII case.
// An empty needle never matches (unlike std::string::find).
inline bool contains_ci(const std::string_view haystack, const std::string_view needle) {
  if (needle.empty() || needle.size() > haystack.size()) {
    return false;
  }
  const std::string h = normalize_ascii_lower(haystack);
  const std::string n = normalize_ascii_lower(needle);
  return h.find(n) != std::string::npos;
}

// contains_any_ci reports whether any needle occurs in haystack (ASCII case-insensitive).
inline bool contains_any_ci(const std::string_view haystack,
                            const std::vector<std::string_view>& needles) {
  return std::any_of(needles.begin(), needles.end(),
                     [&](const std::string_view n) { return contains_ci(haystack, n); });
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// split_whitespace splits on runs of ASCII whitespace. Punctuation stays attached
// to its word.
inline std::vector<std::string> split_whitespace(const std::string_view input) {
  std::vector<std::string> words;
  std::string current;

  for (const char ch : input) {
    if (is_ascii_space(ch)) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
    } else {
      current.push_back(ch);
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }

  return words;
}

// tokenize_ascii splits input on non-alphanumeric delimiters into lowercase tokens,
// dropping tokens shorter than min_length. Tokens are returned in encounter order.
inline std::vector<std::string> tokenize_ascii(const std::string_view input,
                                               const std::size_t min_length = 2) {
  std::vector<std::string> tokens;
  std::string current;

  auto flush = [&]() {
    if (!current.empty() && current.size() >= min_length) {
      tokens.push_back(current);
    }
    current.clear();
  };

  for (const char ch : input) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')) {
      current.push_back(ch);
    } else if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      current.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      flush();
    }
  }
  flush();

  return tokens;
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// split_on cuts input at every delimiter. Empty pieces are kept.
inline std::vector<std::string> split_on(const std::string_view input, const char delimiter) {
  std::vector<std::string> pieces;
  std::size_t start = 0;
  while (true) {
    const std::size_t pos = input.find(delimiter, start);
    if (pos == std::string_view::npos) {
      pieces.emplace_back(input.substr(start));
      return pieces;
    }
    pieces.emplace_back(input.substr(start, pos - start));
    start = pos + 1;
  }
}

// join concatenates non-empty parts with a single separator.
inline std::string join_non_empty(const std::vector<std::string>& parts,
                                  const std::string_view separator = " ") {
  std::string out;
  for (const auto& part : parts) {
    if (part.empty()) {
      continue;
    }
    if (!out.empty()) {
      out += separator;
    }
    out += part;
  }
  return out;
}

}  // namespace stylegate::core
