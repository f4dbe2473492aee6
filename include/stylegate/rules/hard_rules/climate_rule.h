#pragma once

#include "stylegate/rules/hard_rule.h"

namespace stylegate::rules {

// Warns on heavy winter layering in hot climates and on summer-weight upper wear
// without layering in cold climates. Never blocks.
class ClimateRule final : public HardRule {
 public:
  ClimateRule() = default;

  [[nodiscard]] std::string_view rule_family() const noexcept override { return "climate"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Layering must suit the climate";
  }

  [[nodiscard]] std::vector<RuleViolation> Evaluate(const domain::OutfitDraft& draft,
                                                    const RuleContext& context,
                                                    const RuleConfig& config) const override;
};

}  // namespace stylegate::rules
