#pragma once

#include "stylegate/domain/outfit_draft.h"
#include "stylegate/rules/rule_context.h"
#include "stylegate/rules/violation.h"

#include <string_view>
#include <vector>

namespace stylegate::rules {

// HardRule is the abstract base for deterministic outfit constraints.
// Rules report violations at their natural severity; relaxation is applied by the
// evaluator, never inside a rule.
class HardRule {
 public:
  virtual ~HardRule() = default;

  [[nodiscard]] virtual std::string_view rule_family() const noexcept = 0;
  [[nodiscard]] virtual std::string_view description() const noexcept = 0;

  [[nodiscard]] virtual std::vector<RuleViolation> Evaluate(const domain::OutfitDraft& draft,
                                                            const RuleContext& context,
                                                            const RuleConfig& config) const = 0;

 protected:
  HardRule() = default;
  HardRule(const HardRule&) = default;
  HardRule& operator=(const HardRule&) = default;
  HardRule(HardRule&&) = default;
  HardRule& operator=(HardRule&&) = default;
};

}  // namespace stylegate::rules
