#pragma once

#include "stylegate/rules/hard_rule.h"

namespace stylegate::rules {

class EthnicCoherenceRule final : public HardRule {
 public:
  EthnicCoherenceRule() = default;

  [[nodiscard]] std::string_view rule_family() const noexcept override {
    return "ethnic_coherence";
  }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Ethnic upper wear must not be paired with sportswear";
  }

  [[nodiscard]] std::vector<RuleViolation> Evaluate(const domain::OutfitDraft& draft,
                                                    const RuleContext& context,
                                                    const RuleConfig& config) const override;
};

}  // namespace stylegate::rules
