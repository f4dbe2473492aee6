#include "stylegate/rules/hard_rules/duplicate_items_rule.h"

#include "stylegate/rules/rule_ids.h"

#include <algorithm>
#include <map>
#include <string>
#include <utility>

namespace stylegate::rules {

std::vector<RuleViolation> DuplicateItemsRule::Evaluate(const domain::OutfitDraft& draft,
                                                        const RuleContext& /*context*/,
                                                        const RuleConfig& /*config*/) const {
  std::vector<RuleViolation> violations;

  // Ordered by first appearance so repeated evaluation reports identically.
  std::vector<std::string> order;
  std::map<std::string, std::vector<domain::OutfitSlot>> slots_by_id;
  for (const auto& [slot, item] : draft.slots.items_in_order()) {
    if (!item->item_id || item->item_id->empty()) {
      continue;
    }
    auto& slots = slots_by_id[*item->item_id];
    if (slots.empty()) {
      order.push_back(*item->item_id);
    }
    slots.push_back(slot);
  }

  std::vector<std::string> duplicate_ids;
  std::vector<domain::OutfitSlot> involved;
  for (const auto& id : order) {
    const auto& slots = slots_by_id.at(id);
    if (slots.size() < 2) {
      continue;
    }
    duplicate_ids.push_back(id);
    for (const auto slot : slots) {
      if (std::find(involved.begin(), involved.end(), slot) == involved.end()) {
        involved.push_back(slot);
      }
    }
  }

  if (!duplicate_ids.empty()) {
    std::string joined;
    for (const auto& id : duplicate_ids) {
      joined += joined.empty() ? id : ", " + id;
    }
    violations.push_back(RuleViolation{rule_ids::kDuplicateItems, Severity::kBlock,
                                       "Same item used in more than one slot: " + joined,
                                       std::move(involved), std::move(duplicate_ids), 0.0,
                                       false});
  }
  return violations;
}

}  // namespace stylegate::rules
