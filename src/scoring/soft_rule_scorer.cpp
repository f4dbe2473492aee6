#include "stylegate/scoring/soft_rule_scorer.h"

#include "stylegate/core/normalization.h"

#include <algorithm>
#include <utility>

namespace stylegate::scoring {

std::vector<std::string> condition_tokens(const std::string_view condition,
                                          const ScoringConfig& config) {
  std::vector<std::string> tokens;
  for (auto& word : core::split_whitespace(core::normalize_ascii_lower(condition))) {
    if (word.size() >= config.min_token_length) {
      tokens.push_back(std::move(word));
    }
  }
  return tokens;
}

double match_fraction(const std::string_view condition, const std::string_view description,
                      const ScoringConfig& config) {
  const auto tokens = condition_tokens(condition, config);
  if (tokens.empty()) {
    return 0.0;
  }
  const std::string text = core::normalize_ascii_lower(description);
  const auto present = std::count_if(tokens.begin(), tokens.end(), [&](const std::string& t) {
    return text.find(t) != std::string::npos;
  });
  return static_cast<double>(present) / static_cast<double>(tokens.size());
}

SoftScoreResult score_soft_rules(const std::string_view description,
                                 const std::vector<SoftRule>& rules,
                                 const ScoringConfig& config) {
  SoftScoreResult result{};
  double total_weight = 0.0;
  double earned_weight = 0.0;

  for (const auto& rule : rules) {
    total_weight += rule.weight;
    const double fraction = match_fraction(rule.condition, description, config);
    const bool matched = fraction > config.match_threshold;

    switch (rule.type) {
      case SoftRuleType::kPrefer:
        if (matched) {
          earned_weight += rule.weight * fraction;
          result.matched_rules.push_back(rule.id);
        } else {
          earned_weight += rule.weight * config.unmatched_prefer_credit;
        }
        break;
      case SoftRuleType::kAvoid:
        if (matched) {
          earned_weight -= rule.weight * fraction * config.avoid_penalty_multiplier;
          result.violations.push_back(rule.id);
        } else {
          earned_weight += rule.weight * config.unmatched_avoid_credit;
        }
        break;
    }
  }

  result.score = total_weight > 0.0 ? std::clamp(earned_weight / total_weight, 0.0, 1.0)
                                     : config.neutral_score;
  return result;
}

}  // namespace stylegate::scoring
