#pragma once

#include <cstddef>

namespace stylegate::scoring {

// Soft-rule scoring constants. Defaults are the tuned production values.
struct ScoringConfig {
  double match_threshold{0.3};            // Token fraction a rule must exceed to match
  double avoid_penalty_multiplier{0.5};   // Applied to weight * fraction for matched avoids
  double unmatched_prefer_credit{0.3};    // Neutral credit for a prefer rule that missed
  double unmatched_avoid_credit{0.8};     // Reward for staying clear of an avoid rule
  std::size_t min_token_length{4};        // Condition words shorter than this are ignored
  double neutral_score{0.5};              // Score when there are no rules or no targets

  bool operator==(const ScoringConfig&) const = default;
};

}  // namespace stylegate::scoring
