#include "stylegate/rules/hard_rules/ethnic_coherence_rule.h"

#include "slot_text.h"
#include "stylegate/rules/rule_ids.h"

namespace stylegate::rules {

namespace {

constexpr double kDemotionPenalty = 0.5;

bool is_ethnic_upper(const domain::SlotItem& upper) {
  return detail::normalized_category(upper) == "ethnic" ||
         core::contains_any_ci(upper.hint, {"kurta", "sherwani"});
}

bool is_athletic_lower(const domain::SlotItem& lower) {
  const std::string sub = detail::normalized_subcategory(lower);
  return sub.find("gym") != std::string::npos || sub.find("sport") != std::string::npos ||
         detail::normalized_category(lower) == "sportswear" ||
         core::contains_any_ci(lower.hint, {"gym short", "track pant"});
}

}  // namespace

std::vector<RuleViolation> EthnicCoherenceRule::Evaluate(const domain::OutfitDraft& draft,
                                                         const RuleContext& /*context*/,
                                                         const RuleConfig& config) const {
  std::vector<RuleViolation> violations;
  if (!config.check_ethnic_coherence) {
    return violations;
  }

  const auto& upper = draft.slots.upper_wear;
  const auto& lower = draft.slots.lower_wear;
  if (!upper || !lower) {
    return violations;
  }

  if (is_ethnic_upper(*upper) && is_athletic_lower(*lower)) {
    violations.push_back(RuleViolation{
        rule_ids::kEthnicCoherence,
        Severity::kBlock,
        "Ethnic wear paired with athletic bottoms",
        {domain::OutfitSlot::kUpperWear, domain::OutfitSlot::kLowerWear},
        {upper->hint, lower->hint},
        kDemotionPenalty,
        false});
  }
  return violations;
}

}  // namespace stylegate::rules
