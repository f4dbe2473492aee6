#pragma once

#include "stylegate/scoring/scoring_config.h"
#include "stylegate/scoring/soft_rule.h"

#include <string>
#include <string_view>
#include <vector>

namespace stylegate::scoring {

struct SoftScoreResult {
  double score{0.5};
  std::vector<std::string> matched_rules;  // prefer rules that matched
  std::vector<std::string> violations;     // avoid rules that matched

  bool operator==(const SoftScoreResult&) const = default;
};

// condition_tokens splits a condition on whitespace, lowercases, and keeps words of at
// least config.min_token_length characters.
[[nodiscard]] std::vector<std::string> condition_tokens(std::string_view condition,
                                                        const ScoringConfig& config);

// match_fraction is the share of condition tokens that occur as substrings of the
// (lowercased) outfit description.
[[nodiscard]] double match_fraction(std::string_view condition, std::string_view description,
                                    const ScoringConfig& config);

// score_soft_rules returns earned / total weight clamped to [0, 1], or neutral_score when
// rules is empty.
[[nodiscard]] SoftScoreResult score_soft_rules(std::string_view description,
                                               const std::vector<SoftRule>& rules,
                                               const ScoringConfig& config = ScoringConfig{});

}  // namespace stylegate::scoring
