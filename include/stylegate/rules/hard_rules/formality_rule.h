#pragma once

#include "stylegate/rules/hard_rule.h"

namespace stylegate::rules {

// Formality coherence:
// - formal/smart upper with flip-flops, slides or sandals: block
// - formal occasion with gym, sport or track bottoms: block
// - upper and footwear more than one step apart on casual..formal: warn
class FormalityRule final : public HardRule {
 public:
  FormalityRule() = default;

  [[nodiscard]] std::string_view rule_family() const noexcept override { return "formality"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Formality of the pieces must be coherent with each other and the occasion";
  }

  [[nodiscard]] std::vector<RuleViolation> Evaluate(const domain::OutfitDraft& draft,
                                                    const RuleContext& context,
                                                    const RuleConfig& config) const override;
};

}  // namespace stylegate::rules
