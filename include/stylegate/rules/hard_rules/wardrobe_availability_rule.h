#pragma once

#include "stylegate/rules/hard_rule.h"

namespace stylegate::rules {

// Visual responses against a non-empty wardrobe need something to ground each
// mandatory slot on. Warns only; grounding drops what it cannot resolve.
class WardrobeAvailabilityRule final : public HardRule {
 public:
  WardrobeAvailabilityRule() = default;

  [[nodiscard]] std::string_view rule_family() const noexcept override {
    return "wardrobe_availability";
  }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Visual outfits need a hint or item id in every mandatory slot";
  }

  [[nodiscard]] std::vector<RuleViolation> Evaluate(const domain::OutfitDraft& draft,
                                                    const RuleContext& context,
                                                    const RuleConfig& config) const override;
};

}  // namespace stylegate::rules
