#pragma once

#include "stylegate/rules/hard_rule.h"

namespace stylegate::rules {

// Longline or oversized upper over an oversized or relaxed lower. Warn at normal
// strictness, block at strict, skipped when relaxed.
class SilhouetteRule final : public HardRule {
 public:
  SilhouetteRule() = default;

  [[nodiscard]] std::string_view rule_family() const noexcept override { return "silhouette"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Voluminous upper and lower pieces must not be combined";
  }

  [[nodiscard]] std::vector<RuleViolation> Evaluate(const domain::OutfitDraft& draft,
                                                    const RuleContext& context,
                                                    const RuleConfig& config) const override;
};

}  // namespace stylegate::rules
