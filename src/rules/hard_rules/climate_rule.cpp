#include "stylegate/rules/hard_rules/climate_rule.h"

#include "stylegate/core/normalization.h"
#include "stylegate/rules/rule_ids.h"

namespace stylegate::rules {

namespace {

constexpr double kHeavyLayeringPenalty = 0.25;
constexpr double kTooLightPenalty = 0.1;

}  // namespace

std::vector<RuleViolation> ClimateRule::Evaluate(const domain::OutfitDraft& draft,
                                                 const RuleContext& context,
                                                 const RuleConfig& config) const {
  std::vector<RuleViolation> violations;
  if (!config.check_climate || !context.climate) {
    return violations;
  }

  using domain::OutfitSlot;
  using domain::Season;
  const auto& layering = draft.slots.layering;
  const auto& upper = draft.slots.upper_wear;

  if (*context.climate == Season::kHot && layering) {
    const bool heavy =
        core::contains_any_ci(layering->hint, {"puffer", "heavy coat", "wool coat"}) ||
        layering->season == Season::kCold;
    if (heavy) {
      violations.push_back(RuleViolation{rule_ids::kClimateHeavyLayering,
                                         Severity::kWarn,
                                         "Heavy winter layering in hot weather",
                                         {OutfitSlot::kLayering},
                                         {layering->hint},
                                         kHeavyLayeringPenalty,
                                         false});
    }
  }

  if (*context.climate == Season::kCold && upper && upper->season == Season::kHot && !layering) {
    violations.push_back(RuleViolation{rule_ids::kClimateTooLight,
                                       Severity::kWarn,
                                       "Summer-weight top in cold weather with no layering",
                                       {OutfitSlot::kUpperWear},
                                       {upper->hint},
                                       kTooLightPenalty,
                                       false});
  }

  return violations;
}

}  // namespace stylegate::rules
