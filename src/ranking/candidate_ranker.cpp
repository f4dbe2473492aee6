#include "stylegate/ranking/candidate_ranker.h"

#include "stylegate/scoring/aesthetic_scorer.h"

#include <algorithm>
#include <utility>

namespace stylegate::ranking {

std::vector<domain::OutfitDraft> RankingResult::top_outfits(const std::size_t top_n) const {
  std::vector<domain::OutfitDraft> out;
  for (std::size_t i = 0; i < ranked.size() && i < top_n; ++i) {
    out.push_back(ranked[i].draft);
  }
  return out;
}

double combined_score(const double score_penalty, const double soft_score,
                      const double aesthetic_score, const RankWeights& weights) {
  const double total = weights.hard + weights.soft + weights.aesthetic;
  if (total <= 0.0) {
    return 0.0;
  }
  const double hard = std::clamp(1.0 - score_penalty, 0.0, 1.0);
  return (weights.hard * hard + weights.soft * soft_score + weights.aesthetic * aesthetic_score) /
         total;
}

ViolationSummary summarize_violations(const std::vector<CandidateEvaluation>& evaluations) {
  ViolationSummary summary;
  for (const auto& evaluation : evaluations) {
    for (const auto& violation : evaluation.hard_result.violations) {
      ++summary.by_rule[violation.rule_id];
      for (const auto slot : violation.slots_involved) {
        ++summary.by_slot[slot];
      }
      switch (violation.severity) {
        case rules::Severity::kBlock:
          if (std::find(summary.blocking.begin(), summary.blocking.end(), violation.rule_id) ==
              summary.blocking.end()) {
            summary.blocking.push_back(violation.rule_id);
          }
          break;
        case rules::Severity::kWarn:
          break;
      }
    }
  }
  return summary;
}

CandidateRanker::CandidateRanker(RankerConfig config)
    : config_(std::move(config)), evaluator_(rules::make_default_rulebook()) {}

CandidateEvaluation CandidateRanker::evaluate(
    const domain::OutfitDraft& draft, const std::size_t input_index,
    const rules::RuleContext& context, const rules::RuleConfig& rule_config,
    const std::vector<scoring::SoftRule>& soft_rules,
    const std::vector<domain::AestheticTag>& aesthetics,
    const rules::RelaxationPolicy& relaxation) const {
  CandidateEvaluation evaluation{};
  evaluation.input_index = input_index;
  evaluation.draft = draft;
  evaluation.hard_result = evaluator_.evaluate(draft, context, rule_config, relaxation);
  evaluation.missing_slots = domain::missing_slots(draft);
  evaluation.is_complete = evaluation.missing_slots.empty();

  const std::string description = domain::describe_outfit(draft);
  evaluation.soft = scoring::score_soft_rules(description, soft_rules, config_.scoring);
  evaluation.aesthetic_score =
      scoring::score_aesthetic_alignment(description, aesthetics, config_.scoring);
  evaluation.combined_score =
      combined_score(evaluation.hard_result.score_penalty, evaluation.soft.score,
                     evaluation.aesthetic_score, config_.weights);
  return evaluation;
}

RankingResult CandidateRanker::rank(const std::vector<domain::OutfitDraft>& drafts,
                                    const rules::RuleContext& context,
                                    const rules::RuleConfig& rule_config,
                                    const std::vector<scoring::SoftRule>& soft_rules,
                                    const std::vector<domain::AestheticTag>& aesthetics) const {
  RankingResult result{};

  std::vector<CandidateEvaluation> evaluations;
  evaluations.reserve(drafts.size());
  for (std::size_t i = 0; i < drafts.size(); ++i) {
    evaluations.push_back(evaluate(drafts[i], i, context, rule_config, soft_rules, aesthetics,
                                   rules::RelaxationPolicy::none()));
  }

  result.passed_count = static_cast<std::size_t>(std::count_if(
      evaluations.begin(), evaluations.end(), [](const auto& e) { return e.allowed(); }));

  // Relaxed pass: same evaluation, with the policy's block rules demoted to warn.
  const std::size_t min_passed = config_.effective_min_passed();
  if (config_.enable_relaxation && result.passed_count < min_passed &&
      !config_.relaxation.demotable_rule_ids.empty()) {
    for (auto& evaluation : evaluations) {
      if (evaluation.allowed()) {
        continue;
      }
      auto relaxed = evaluate(evaluation.draft, evaluation.input_index, context, rule_config,
                              soft_rules, aesthetics, config_.relaxation);
      if (relaxed.allowed()) {
        relaxed.rescued = true;
        evaluation = std::move(relaxed);
        ++result.rescued_count;
      }
    }
  }

  for (auto& evaluation : evaluations) {
    if (evaluation.hard_result.warning_count() > 0) {
      ++result.warning_count;
    }
  }
  result.summary = summarize_violations(evaluations);

  for (auto& evaluation : evaluations) {
    if (evaluation.allowed()) {
      result.ranked.push_back(std::move(evaluation));
    } else {
      result.blocked.push_back(std::move(evaluation));
    }
  }
  result.blocked_count = result.blocked.size();

  // Explicit tie-break on input order.
  std::sort(result.ranked.begin(), result.ranked.end(),
            [](const CandidateEvaluation& a, const CandidateEvaluation& b) {
              if (a.combined_score != b.combined_score) {
                return a.combined_score > b.combined_score;
              }
              return a.input_index < b.input_index;
            });

  if (drafts.empty()) {
    result.needs_fallback = true;
    result.fallback_reason = "No candidates supplied";
  } else if (result.ranked.empty()) {
    result.needs_fallback = true;
    result.fallback_reason = "All candidates failed hard rules";
  } else if (result.passed_count < min_passed) {
    std::string reason = "Only " + std::to_string(result.passed_count) +
                         " candidates passed (need " + std::to_string(min_passed) + ")";
    if (result.rescued_count > 0) {
      reason += "; relaxed rules rescued " + std::to_string(result.rescued_count);
    }
    result.fallback_reason = std::move(reason);
  }

  return result;
}

}  // namespace stylegate::ranking
