#include "stylegate/rules/hard_rule_evaluator.h"

#include "stylegate/rules/hard_rules/climate_rule.h"
#include "stylegate/rules/hard_rules/duplicate_items_rule.h"
#include "stylegate/rules/hard_rules/ethnic_coherence_rule.h"
#include "stylegate/rules/hard_rules/formality_rule.h"
#include "stylegate/rules/hard_rules/mandatory_slots_rule.h"
#include "stylegate/rules/hard_rules/silhouette_rule.h"
#include "stylegate/rules/hard_rules/wardrobe_availability_rule.h"

#include <algorithm>
#include <utility>

namespace stylegate::rules {

std::size_t HardRuleResult::block_count() const {
  return static_cast<std::size_t>(
      std::count_if(violations.begin(), violations.end(),
                    [](const RuleViolation& v) { return v.severity == Severity::kBlock; }));
}

std::size_t HardRuleResult::warning_count() const {
  return violations.size() - block_count();
}

std::vector<std::string> HardRuleResult::blocking_rule_ids() const {
  std::vector<std::string> ids;
  for (const auto& v : violations) {
    if (v.severity == Severity::kBlock &&
        std::find(ids.begin(), ids.end(), v.rule_id) == ids.end()) {
      ids.push_back(v.rule_id);
    }
  }
  return ids;
}

Rulebook make_default_rulebook() {
  Rulebook rulebook{};

  // Fixed evaluation order
  rulebook.rules.push_back(std::make_unique<MandatorySlotsRule>());
  rulebook.rules.push_back(std::make_unique<FormalityRule>());
  rulebook.rules.push_back(std::make_unique<SilhouetteRule>());
  rulebook.rules.push_back(std::make_unique<EthnicCoherenceRule>());
  rulebook.rules.push_back(std::make_unique<ClimateRule>());
  rulebook.rules.push_back(std::make_unique<DuplicateItemsRule>());
  rulebook.rules.push_back(std::make_unique<WardrobeAvailabilityRule>());

  return rulebook;
}

HardRuleEvaluator::HardRuleEvaluator(Rulebook rulebook) : rulebook_(std::move(rulebook)) {}

HardRuleResult HardRuleEvaluator::evaluate(const domain::OutfitDraft& draft,
                                           const RuleContext& context, const RuleConfig& config,
                                           const RelaxationPolicy& relaxation) const {
  HardRuleResult result{};

  for (const auto& rule : rulebook_.rules) {
    if (!rule) {
      continue;
    }
    auto violations = rule->Evaluate(draft, context, config);
    for (auto& violation : violations) {
      if (violation.severity == Severity::kBlock && relaxation.demotes(violation.rule_id)) {
        violation.severity = Severity::kWarn;
        violation.demoted = true;
      }
      result.violations.push_back(std::move(violation));
    }
  }

  for (const auto& violation : result.violations) {
    switch (violation.severity) {
      case Severity::kBlock:
        result.allowed = false;
        break;
      case Severity::kWarn:
        result.score_penalty += violation.penalty;
        break;
    }
  }

  return result;
}

HardRuleResult evaluate_hard_rules(const domain::OutfitDraft& draft, const RuleContext& context,
                                   const RuleConfig& config, const RelaxationPolicy& relaxation) {
  static const HardRuleEvaluator kDefaultEvaluator(make_default_rulebook());
  return kDefaultEvaluator.evaluate(draft, context, config, relaxation);
}

}  // namespace stylegate::rules
