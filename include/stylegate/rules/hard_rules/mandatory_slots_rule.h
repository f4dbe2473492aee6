#pragma once

#include "stylegate/rules/hard_rule.h"

namespace stylegate::rules {

// Blocks drafts missing a mandatory slot. A dress or jumpsuit in upper_wear
// covers lower_wear; nothing covers footwear.
class MandatorySlotsRule final : public HardRule {
 public:
  MandatorySlotsRule() = default;

  [[nodiscard]] std::string_view rule_family() const noexcept override { return "mandatory_slots"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Upper, lower and footwear must be present unless the upper is a dress";
  }

  [[nodiscard]] std::vector<RuleViolation> Evaluate(const domain::OutfitDraft& draft,
                                                    const RuleContext& context,
                                                    const RuleConfig& config) const override;
};

}  // namespace stylegate::rules
