#include "stylegate/rules/hard_rules/formality_rule.h"

#include "slot_text.h"
#include "stylegate/rules/rule_ids.h"

namespace stylegate::rules {

namespace {

constexpr double kFootwearMismatchPenalty = 0.4;
constexpr double kOccasionMismatchPenalty = 0.4;
constexpr double kGeneralMismatchPenalty = 0.2;

bool is_dressy(const domain::Formality formality) {
  return formality == domain::Formality::kFormal || formality == domain::Formality::kSmart;
}

}  // namespace

std::vector<RuleViolation> FormalityRule::Evaluate(const domain::OutfitDraft& draft,
                                                   const RuleContext& context,
                                                   const RuleConfig& config) const {
  std::vector<RuleViolation> violations;
  if (!config.check_formality) {
    return violations;
  }

  using domain::OutfitSlot;
  const auto& upper = draft.slots.upper_wear;
  const auto& lower = draft.slots.lower_wear;
  const auto& footwear = draft.slots.footwear;

  if (upper && footwear && upper->formality && is_dressy(*upper->formality)) {
    const std::string sub = detail::normalized_subcategory(*footwear);
    if (detail::is_any_of(sub, {"flip-flops", "slides", "sandals"})) {
      violations.push_back(RuleViolation{
          rule_ids::kFormalityFootwear,
          Severity::kBlock,
          "A " + std::string(domain::to_string(*upper->formality)) + " top cannot be worn with " +
              sub,
          {OutfitSlot::kUpperWear, OutfitSlot::kFootwear},
          {upper->hint, footwear->hint},
          kFootwearMismatchPenalty,
          false});
    }
  }

  if (lower && context.formality == domain::Formality::kFormal) {
    const std::string sub = detail::normalized_subcategory(*lower);
    if (sub.find("gym") != std::string::npos || sub.find("sport") != std::string::npos ||
        sub.find("track") != std::string::npos) {
      violations.push_back(RuleViolation{rule_ids::kFormalityOccasion,
                                         Severity::kBlock,
                                         "Athletic bottoms (" + sub + ") at a formal occasion",
                                         {OutfitSlot::kLowerWear},
                                         {lower->hint},
                                         kOccasionMismatchPenalty,
                                         false});
    }
  }

  // Compatibility chain is casual <-> smart-casual <-> smart <-> formal; only
  // neighbours are compatible.
  if (upper && footwear && upper->formality && footwear->formality &&
      domain::formality_distance(*upper->formality, *footwear->formality) > 1) {
    violations.push_back(RuleViolation{
        rule_ids::kFormalityGeneral,
        Severity::kWarn,
        "Formality clash: " + std::string(domain::to_string(*upper->formality)) + " top with " +
            std::string(domain::to_string(*footwear->formality)) + " footwear",
        {OutfitSlot::kUpperWear, OutfitSlot::kFootwear},
        {upper->hint, footwear->hint},
        kGeneralMismatchPenalty,
        false});
  }

  return violations;
}

}  // namespace stylegate::rules
