#include "stylegate/rules/hard_rules/wardrobe_availability_rule.h"

#include "stylegate/core/normalization.h"
#include "stylegate/rules/rule_ids.h"

#include <string>

namespace stylegate::rules {

namespace {

bool is_unresolvable(const domain::SlotItem* item) {
  return item != nullptr && core::trim(item->hint).empty() &&
         (!item->item_id || item->item_id->empty());
}

const char* rule_id_for(const domain::OutfitSlot slot) {
  switch (slot) {
    case domain::OutfitSlot::kUpperWear:
      return rule_ids::kWardrobeUpperMissing;
    case domain::OutfitSlot::kLowerWear:
      return rule_ids::kWardrobeLowerMissing;
    case domain::OutfitSlot::kFootwear:
    case domain::OutfitSlot::kLayering:
    case domain::OutfitSlot::kAccessories:
      break;
  }
  return rule_ids::kWardrobeFootwearMissing;
}

}  // namespace

std::vector<RuleViolation> WardrobeAvailabilityRule::Evaluate(const domain::OutfitDraft& draft,
                                                              const RuleContext& context,
                                                              const RuleConfig& /*config*/) const {
  std::vector<RuleViolation> violations;
  if (context.response_mode != domain::ResponseMode::kVisualOutfit ||
      !context.has_wardrobe_items) {
    return violations;
  }

  // Absent slots are the mandatory-slot rule's concern; this rule flags present slots
  // that carry nothing to ground on.
  for (const auto slot : domain::kMandatorySlots) {
    const domain::SlotItem* item = draft.slots.get(slot);
    if (!is_unresolvable(item)) {
      continue;
    }
    violations.push_back(RuleViolation{rule_id_for(slot),
                                       Severity::kWarn,
                                       std::string(domain::to_string(slot)) +
                                           " has no hint or wardrobe item to show",
                                       {slot},
                                       {},
                                       0.0,
                                       false});
  }
  return violations;
}

}  // namespace stylegate::rules
