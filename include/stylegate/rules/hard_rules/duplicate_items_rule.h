#pragma once

#include "stylegate/rules/hard_rule.h"

namespace stylegate::rules {

class DuplicateItemsRule final : public HardRule {
 public:
  DuplicateItemsRule() = default;

  [[nodiscard]] std::string_view rule_family() const noexcept override { return "duplicate_items"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "An item id may appear in at most one slot";
  }

  [[nodiscard]] std::vector<RuleViolation> Evaluate(const domain::OutfitDraft& draft,
                                                    const RuleContext& context,
                                                    const RuleConfig& config) const override;
};

}  // namespace stylegate::rules
