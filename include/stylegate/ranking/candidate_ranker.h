#pragma once

#include "stylegate/domain/outfit_draft.h"
#include "stylegate/domain/taxonomy.h"
#include "stylegate/rules/hard_rule_evaluator.h"
#include "stylegate/rules/rule_context.h"
#include "stylegate/scoring/scoring_config.h"
#include "stylegate/scoring/soft_rule.h"
#include "stylegate/scoring/soft_rule_scorer.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stylegate::ranking {

// RankWeights blend the three per-draft signals into one combined score.
struct RankWeights {
  double hard{0.4};  // Applied to clamp(1 - score_penalty)
  double soft{0.45};
  double aesthetic{0.15};

  bool operator==(const RankWeights&) const = default;
};

struct RankerConfig {
  std::size_t top_n{3};
  // Relaxation runs when fewer than this many drafts pass; defaults to top_n.
  std::optional<std::size_t> min_passed;
  RankWeights weights;
  bool enable_relaxation{true};
  rules::RelaxationPolicy relaxation{rules::RelaxationPolicy::defaults()};
  scoring::ScoringConfig scoring;

  [[nodiscard]] std::size_t effective_min_passed() const noexcept {
    return min_passed.value_or(top_n);
  }

  bool operator==(const RankerConfig&) const = default;
};

// CandidateEvaluation is the full record for one input draft.
struct CandidateEvaluation {
  std::size_t input_index{0};
  domain::OutfitDraft draft;
  rules::HardRuleResult hard_result;
  scoring::SoftScoreResult soft;
  double aesthetic_score{0.5};
  double combined_score{0.0};
  bool is_complete{false};
  std::vector<domain::OutfitSlot> missing_slots;
  bool rescued{false};  // Blocked on the strict pass, allowed after relaxation

  [[nodiscard]] bool allowed() const noexcept { return hard_result.allowed; }
};

struct ViolationSummary {
  std::map<std::string, int> by_rule;
  std::map<domain::OutfitSlot, int> by_slot;
  std::vector<std::string> blocking;  // First-seen order

  bool operator==(const ViolationSummary&) const = default;
};

// RankingResult: ranked holds every surviving draft, best first; blocked holds the rest
// in input order.
struct RankingResult {
  std::vector<CandidateEvaluation> ranked;
  std::vector<CandidateEvaluation> blocked;
  std::size_t passed_count{0};   // Allowed on the strict pass
  std::size_t rescued_count{0};  // Allowed only after relaxation
  std::size_t blocked_count{0};  // Still blocked after relaxation
  std::size_t warning_count{0};  // Drafts with at least one warn violation
  bool needs_fallback{false};
  std::optional<std::string> fallback_reason;
  ViolationSummary summary;

  // The first top_n ranked drafts.
  [[nodiscard]] std::vector<domain::OutfitDraft> top_outfits(std::size_t top_n) const;
};

[[nodiscard]] double combined_score(double score_penalty, double soft_score,
                                    double aesthetic_score, const RankWeights& weights);

[[nodiscard]] ViolationSummary summarize_violations(
    const std::vector<CandidateEvaluation>& evaluations);

// CandidateRanker evaluates a batch of drafts and orders the survivors.
// Ordering is by combined score descending; equal scores keep input order.
class CandidateRanker {
 public:
  explicit CandidateRanker(RankerConfig config = RankerConfig{});

  [[nodiscard]] CandidateEvaluation evaluate(const domain::OutfitDraft& draft,
                                             std::size_t input_index,
                                             const rules::RuleContext& context,
                                             const rules::RuleConfig& rule_config,
                                             const std::vector<scoring::SoftRule>& soft_rules,
                                             const std::vector<domain::AestheticTag>& aesthetics,
                                             const rules::RelaxationPolicy& relaxation) const;

  [[nodiscard]] RankingResult rank(const std::vector<domain::OutfitDraft>& drafts,
                                   const rules::RuleContext& context,
                                   const rules::RuleConfig& rule_config,
                                   const std::vector<scoring::SoftRule>& soft_rules,
                                   const std::vector<domain::AestheticTag>& aesthetics = {}) const;

  [[nodiscard]] const RankerConfig& config() const noexcept { return config_; }

 private:
  RankerConfig config_;
  rules::HardRuleEvaluator evaluator_;
};

}  // namespace stylegate::ranking
