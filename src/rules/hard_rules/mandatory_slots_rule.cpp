#include "stylegate/rules/hard_rules/mandatory_slots_rule.h"

#include "stylegate/rules/rule_ids.h"

#include <string>
#include <utility>

namespace stylegate::rules {

std::vector<RuleViolation> MandatorySlotsRule::Evaluate(const domain::OutfitDraft& draft,
                                                        const RuleContext& /*context*/,
                                                        const RuleConfig& /*config*/) const {
  std::vector<RuleViolation> violations;

  const auto missing = domain::missing_slots(draft);
  if (missing.empty()) {
    return violations;
  }

  std::string names;
  std::vector<std::string> evidence;
  for (const auto slot : missing) {
    if (!names.empty()) {
      names += ", ";
    }
    names += std::string(domain::to_string(slot));
    evidence.emplace_back(domain::to_string(slot));
  }

  violations.push_back(RuleViolation{rule_ids::kMandatorySlots, Severity::kBlock,
                                     "Outfit is missing required slots: " + names, missing,
                                     std::move(evidence), 0.0, false});
  return violations;
}

}  // namespace stylegate::rules
