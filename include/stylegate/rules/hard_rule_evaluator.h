#pragma once

#include "stylegate/domain/outfit_draft.h"
#include "stylegate/rules/hard_rule.h"
#include "stylegate/rules/rule_context.h"
#include "stylegate/rules/violation.h"

#include <memory>
#include <string>
#include <vector>

namespace stylegate::rules {

// HardRuleResult is the verdict for one draft.
// allowed == no violation with (effective) block severity.
// score_penalty sums the penalties of warn-severity violations only; blocking is terminal.
struct HardRuleResult {
  bool allowed{true};
  std::vector<RuleViolation> violations;
  double score_penalty{0.0};

  [[nodiscard]] std::size_t block_count() const;
  [[nodiscard]] std::size_t warning_count() const;
  [[nodiscard]] std::vector<std::string> blocking_rule_ids() const;

  bool operator==(const HardRuleResult&) const = default;
};

// Rulebook is an ordered set of hard rules. Evaluation order is vector order, and
// violations are reported in that order.
struct Rulebook {
  std::vector<std::unique_ptr<const HardRule>> rules;
};

[[nodiscard]] Rulebook make_default_rulebook();

// HardRuleEvaluator runs every rule (no short-circuit) and folds the violations into a
// HardRuleResult. Immutable after construction; safe to share across threads.
class HardRuleEvaluator {
 public:
  explicit HardRuleEvaluator(Rulebook rulebook);

  // relaxation demotes the named block violations to warn; their penalty then counts
  // towards score_penalty. Pass RelaxationPolicy::none() for a strict evaluation.
  [[nodiscard]] HardRuleResult evaluate(const domain::OutfitDraft& draft,
                                        const RuleContext& context, const RuleConfig& config,
                                        const RelaxationPolicy& relaxation) const;

  [[nodiscard]] HardRuleResult evaluate(const domain::OutfitDraft& draft,
                                        const RuleContext& context,
                                        const RuleConfig& config) const {
    return evaluate(draft, context, config, RelaxationPolicy::none());
  }

 private:
  Rulebook rulebook_;
};

// evaluate_hard_rules evaluates with the default rulebook.
[[nodiscard]] HardRuleResult evaluate_hard_rules(
    const domain::OutfitDraft& draft, const RuleContext& context, const RuleConfig& config,
    const RelaxationPolicy& relaxation = RelaxationPolicy::none());

}  // namespace stylegate::rules
