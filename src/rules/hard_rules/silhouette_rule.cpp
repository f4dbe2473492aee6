#include "stylegate/rules/hard_rules/silhouette_rule.h"

#include "stylegate/rules/rule_ids.h"

namespace stylegate::rules {

namespace {

constexpr double kWarnPenalty = 0.15;
constexpr double kBlockPenalty = 0.5;

}  // namespace

std::vector<RuleViolation> SilhouetteRule::Evaluate(const domain::OutfitDraft& draft,
                                                    const RuleContext& /*context*/,
                                                    const RuleConfig& config) const {
  std::vector<RuleViolation> violations;
  if (!config.check_silhouette) {
    return violations;
  }

  using domain::Silhouette;
  const auto& upper = draft.slots.upper_wear;
  const auto& lower = draft.slots.lower_wear;
  if (!upper || !lower || !upper->silhouette || !lower->silhouette) {
    return violations;
  }

  const bool long_upper =
      *upper->silhouette == Silhouette::kLongline || *upper->silhouette == Silhouette::kOversized;
  const bool loose_lower =
      *lower->silhouette == Silhouette::kOversized || *lower->silhouette == Silhouette::kRelaxed;
  if (!long_upper || !loose_lower) {
    return violations;
  }

  Severity severity = Severity::kWarn;
  double penalty = kWarnPenalty;
  switch (config.strictness) {
    case Strictness::kRelaxed:
      return violations;
    case Strictness::kNormal:
      break;
    case Strictness::kStrict:
      severity = Severity::kBlock;
      penalty = kBlockPenalty;
      break;
  }

  violations.push_back(RuleViolation{
      rule_ids::kSilhouette,
      severity,
      std::string(domain::to_string(*upper->silhouette)) + " upper over " +
          std::string(domain::to_string(*lower->silhouette)) + " lower loses the shape",
      {domain::OutfitSlot::kUpperWear, domain::OutfitSlot::kLowerWear},
      {upper->hint, lower->hint},
      penalty,
      false});
  return violations;
}

}  // namespace stylegate::rules
