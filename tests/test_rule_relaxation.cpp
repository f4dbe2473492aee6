#include "stylegate/rules/hard_rule_evaluator.h"
#include "stylegate/rules/rule_ids.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "styling_fixtures.h"

using namespace stylegate;
using namespace stylegate::rules;
using Catch::Matchers::WithinAbs;
using stylegate::testing::casual_outfit;
using stylegate::testing::slot;

namespace {

RuleContext formal_context() {
  RuleContext context;
  context.response_mode = domain::ResponseMode::kAdvisoryText;
  context.formality = domain::Formality::kFormal;
  return context;
}

domain::OutfitDraft track_pants_outfit() {
  auto draft = casual_outfit("track-1");
  draft.slots.lower_wear = slot("navy track pants", "sportswear", "track-pants");
  return draft;
}

}  // namespace

TEST_CASE("Default relaxation names silhouette and occasion rules", "[rules][relaxation]") {
  const auto policy = RelaxationPolicy::defaults();
  CHECK(policy.demotes(rule_ids::kSilhouette));
  CHECK(policy.demotes(rule_ids::kFormalityOccasion));
  CHECK_FALSE(policy.demotes(rule_ids::kFormalityFootwear));
  CHECK_FALSE(RelaxationPolicy::none().demotes(rule_ids::kSilhouette));
}

TEST_CASE("Structural rules are never demotable", "[rules][relaxation]") {
  CHECK_FALSE(is_demotable_rule(rule_ids::kMandatorySlots));
  CHECK_FALSE(is_demotable_rule(rule_ids::kDuplicateItems));
  CHECK(is_demotable_rule(rule_ids::kEthnicCoherence));

  RelaxationPolicy policy;
  policy.demotable_rule_ids = {rule_ids::kMandatorySlots, rule_ids::kDuplicateItems};
  CHECK_FALSE(policy.demotes(rule_ids::kMandatorySlots));
  CHECK_FALSE(policy.demotes(rule_ids::kDuplicateItems));

  auto draft = casual_outfit();
  draft.slots.footwear.reset();
  const auto result = evaluate_hard_rules(draft, formal_context(), RuleConfig{}, policy);
  CHECK_FALSE(result.allowed);
  REQUIRE(result.violations.size() == 1);
  CHECK_FALSE(result.violations[0].demoted);
}

TEST_CASE("Demoted blocks become penalised warnings", "[rules][relaxation]") {
  const auto draft = track_pants_outfit();

  const auto strict = evaluate_hard_rules(draft, formal_context(), RuleConfig{});
  CHECK_FALSE(strict.allowed);
  CHECK_THAT(strict.score_penalty, WithinAbs(0.0, 1e-9));

  const auto relaxed = evaluate_hard_rules(draft, formal_context(), RuleConfig{},
                                           RelaxationPolicy::defaults());
  CHECK(relaxed.allowed);
  REQUIRE(relaxed.violations.size() == 1);
  const auto& violation = relaxed.violations[0];
  CHECK(violation.rule_id == rule_ids::kFormalityOccasion);
  CHECK(violation.severity == Severity::kWarn);
  CHECK(violation.demoted);
  CHECK_THAT(relaxed.score_penalty, WithinAbs(0.4, 1e-9));
  CHECK(relaxed.blocking_rule_ids().empty());
}

TEST_CASE("Relaxation leaves unlisted blocks in place", "[rules][relaxation]") {
  auto draft = track_pants_outfit();
  draft.slots.upper_wear = slot("black blazer shirt", "tops", "shirt");
  draft.slots.upper_wear->formality = domain::Formality::kFormal;
  draft.slots.footwear = slot("leather slides", "footwear", "slides");

  const auto result = evaluate_hard_rules(draft, formal_context(), RuleConfig{},
                                          RelaxationPolicy::defaults());
  CHECK_FALSE(result.allowed);
  CHECK(result.blocking_rule_ids() ==
        std::vector<std::string>{rule_ids::kFormalityFootwear});
  CHECK(result.block_count() == 1);
  CHECK(result.warning_count() == 1);
}

TEST_CASE("Strict silhouette blocks are rescued by the default policy", "[rules][relaxation]") {
  auto draft = casual_outfit();
  draft.slots.upper_wear->silhouette = domain::Silhouette::kLongline;
  draft.slots.lower_wear->silhouette = domain::Silhouette::kRelaxed;
  RuleConfig config;
  config.strictness = Strictness::kStrict;

  RuleContext context;
  context.response_mode = domain::ResponseMode::kAdvisoryText;

  CHECK_FALSE(evaluate_hard_rules(draft, context, config).allowed);

  const auto relaxed = evaluate_hard_rules(draft, context, config, RelaxationPolicy::defaults());
  CHECK(relaxed.allowed);
  CHECK_THAT(relaxed.score_penalty, WithinAbs(0.5, 1e-9));
}
