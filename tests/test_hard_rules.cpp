#include "stylegate/rules/hard_rule_evaluator.h"
#include "stylegate/rules/hard_rules/mandatory_slots_rule.h"
#include "stylegate/rules/rule_ids.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "styling_fixtures.h"

#include <algorithm>
#include <memory>
#include <string>

using namespace stylegate;
using namespace stylegate::rules;
using Catch::Matchers::WithinAbs;
using domain::Formality;
using domain::OutfitSlot;
using domain::Season;
using domain::Silhouette;
using stylegate::testing::casual_outfit;
using stylegate::testing::slot;

namespace {

const RuleViolation* find_violation(const HardRuleResult& result, const std::string& rule_id) {
  const auto it = std::find_if(result.violations.begin(), result.violations.end(),
                               [&](const RuleViolation& v) { return v.rule_id == rule_id; });
  return it == result.violations.end() ? nullptr : &*it;
}

RuleContext advisory_context() {
  RuleContext context;
  context.response_mode = domain::ResponseMode::kAdvisoryText;
  return context;
}

// A rule that blocks every draft; used to check custom rulebooks.
class AlwaysBlockRule final : public HardRule {
 public:
  [[nodiscard]] std::string_view rule_family() const noexcept override { return "test"; }
  [[nodiscard]] std::string_view description() const noexcept override { return "blocks"; }

  [[nodiscard]] std::vector<RuleViolation> Evaluate(const domain::OutfitDraft& /*draft*/,
                                                    const RuleContext& /*context*/,
                                                    const RuleConfig& /*config*/) const override {
    return {RuleViolation{"always_block", Severity::kBlock, "blocked", {}, {}, 0.3, false}};
  }
};

}  // namespace

TEST_CASE("A complete casual outfit passes cleanly", "[rules]") {
  const auto result = evaluate_hard_rules(casual_outfit(), advisory_context(), RuleConfig{});

  CHECK(result.allowed);
  CHECK(result.violations.empty());
  CHECK_THAT(result.score_penalty, WithinAbs(0.0, 1e-9));
}

TEST_CASE("Missing mandatory slots block", "[rules][mandatory]") {
  auto draft = casual_outfit();
  draft.slots.footwear.reset();

  const auto result = evaluate_hard_rules(draft, advisory_context(), RuleConfig{});

  CHECK_FALSE(result.allowed);
  const auto* violation = find_violation(result, rule_ids::kMandatorySlots);
  REQUIRE(violation != nullptr);
  CHECK(violation->severity == Severity::kBlock);
  REQUIRE(violation->slots_involved.size() == 1);
  CHECK(violation->slots_involved[0] == OutfitSlot::kFootwear);
  CHECK(violation->evidence[0] == "footwear");
}

TEST_CASE("A dress with footwear satisfies the mandatory slots", "[rules][mandatory]") {
  domain::OutfitDraft draft;
  draft.id = "dress-1";
  draft.slots.upper_wear = slot("floral wrap dress", "dresses", "midi");
  draft.slots.footwear = slot("tan sandals", "footwear", "sandals");

  const auto result = evaluate_hard_rules(draft, advisory_context(), RuleConfig{});
  CHECK(result.allowed);
  CHECK(find_violation(result, rule_ids::kMandatorySlots) == nullptr);
}

TEST_CASE("Dressy tops cannot go with beach footwear", "[rules][formality]") {
  auto draft = casual_outfit();
  draft.slots.upper_wear = slot("crisp white shirt", "tops", "shirt");
  draft.slots.upper_wear->formality = Formality::kFormal;
  draft.slots.footwear = slot("rubber flip flops", "footwear", "Flip Flops");

  const auto result = evaluate_hard_rules(draft, advisory_context(), RuleConfig{});

  CHECK_FALSE(result.allowed);
  const auto* violation = find_violation(result, rule_ids::kFormalityFootwear);
  REQUIRE(violation != nullptr);
  CHECK(violation->severity == Severity::kBlock);
  CHECK_THAT(violation->penalty, WithinAbs(0.4, 1e-9));

  SECTION("disabled formality checks let it through") {
    RuleConfig config;
    config.check_formality = false;
    CHECK(evaluate_hard_rules(draft, advisory_context(), config).allowed);
  }
}

TEST_CASE("Athletic bottoms block at a formal occasion only", "[rules][formality]") {
  auto draft = casual_outfit();
  draft.slots.lower_wear = slot("black track pants", "sportswear", "track-pants");

  auto context = advisory_context();
  CHECK(evaluate_hard_rules(draft, context, RuleConfig{}).allowed);

  context.formality = Formality::kFormal;
  const auto result = evaluate_hard_rules(draft, context, RuleConfig{});
  CHECK_FALSE(result.allowed);
  CHECK(result.blocking_rule_ids() == std::vector<std::string>{rule_ids::kFormalityOccasion});
}

TEST_CASE("Formality more than one step apart warns", "[rules][formality]") {
  auto draft = casual_outfit();
  draft.slots.upper_wear->formality = Formality::kCasual;
  draft.slots.footwear->formality = Formality::kSmart;

  const auto result = evaluate_hard_rules(draft, advisory_context(), RuleConfig{});
  CHECK(result.allowed);
  const auto* violation = find_violation(result, rule_ids::kFormalityGeneral);
  REQUIRE(violation != nullptr);
  CHECK(violation->severity == Severity::kWarn);
  CHECK_THAT(result.score_penalty, WithinAbs(0.2, 1e-9));

  SECTION("neighbours are compatible") {
    draft.slots.footwear->formality = Formality::kSmartCasual;
    CHECK(evaluate_hard_rules(draft, advisory_context(), RuleConfig{}).violations.empty());
  }
}

TEST_CASE("Silhouette severity follows strictness", "[rules][silhouette]") {
  auto draft = casual_outfit();
  draft.slots.upper_wear->silhouette = Silhouette::kOversized;
  draft.slots.lower_wear->silhouette = Silhouette::kRelaxed;
  RuleConfig config;

  SECTION("normal warns") {
    const auto result = evaluate_hard_rules(draft, advisory_context(), config);
    CHECK(result.allowed);
    const auto* violation = find_violation(result, rule_ids::kSilhouette);
    REQUIRE(violation != nullptr);
    CHECK(violation->severity == Severity::kWarn);
    CHECK_THAT(result.score_penalty, WithinAbs(0.15, 1e-9));
  }

  SECTION("strict blocks") {
    config.strictness = Strictness::kStrict;
    const auto result = evaluate_hard_rules(draft, advisory_context(), config);
    CHECK_FALSE(result.allowed);
    CHECK_THAT(find_violation(result, rule_ids::kSilhouette)->penalty, WithinAbs(0.5, 1e-9));
  }

  SECTION("relaxed skips") {
    config.strictness = Strictness::kRelaxed;
    CHECK(evaluate_hard_rules(draft, advisory_context(), config).violations.empty());
  }

  SECTION("slim lower is fine") {
    draft.slots.lower_wear->silhouette = Silhouette::kSlim;
    CHECK(evaluate_hard_rules(draft, advisory_context(), config).violations.empty());
  }
}

TEST_CASE("Ethnic upper with athletic lower blocks", "[rules][ethnic]") {
  auto draft = casual_outfit();
  draft.slots.upper_wear = slot("cream Kurta", "ethnic", "kurta");
  draft.slots.lower_wear = slot("grey gym shorts", "bottoms", "shorts");

  const auto result = evaluate_hard_rules(draft, advisory_context(), RuleConfig{});
  CHECK_FALSE(result.allowed);
  const auto* violation = find_violation(result, rule_ids::kEthnicCoherence);
  REQUIRE(violation != nullptr);
  CHECK(violation->slots_involved.size() == 2);

  SECTION("sport subcategory blocks") {
    draft.slots.lower_wear = slot("grey joggers", "bottoms", "Sports Joggers");
    CHECK_FALSE(evaluate_hard_rules(draft, advisory_context(), RuleConfig{}).allowed);
  }

  SECTION("tailored lower is coherent") {
    draft.slots.lower_wear = slot("white churidar", "ethnic", "salwar");
    CHECK(evaluate_hard_rules(draft, advisory_context(), RuleConfig{}).allowed);
  }
}

TEST_CASE("Climate warnings", "[rules][climate]") {
  auto context = advisory_context();

  SECTION("heavy layering in hot weather") {
    auto draft = casual_outfit();
    draft.slots.layering = slot("black puffer jacket", "outerwear", "puffer");
    context.climate = Season::kHot;

    const auto result = evaluate_hard_rules(draft, context, RuleConfig{});
    CHECK(result.allowed);
    REQUIRE(find_violation(result, rule_ids::kClimateHeavyLayering) != nullptr);
    CHECK_THAT(result.score_penalty, WithinAbs(0.25, 1e-9));
  }

  SECTION("cold-season layering by attribute") {
    auto draft = casual_outfit();
    draft.slots.layering = slot("long overcoat");
    draft.slots.layering->season = Season::kCold;
    context.climate = Season::kHot;
    CHECK(find_violation(evaluate_hard_rules(draft, context, RuleConfig{}),
                         rule_ids::kClimateHeavyLayering) != nullptr);
  }

  SECTION("summer top in the cold with nothing over it") {
    auto draft = casual_outfit();
    draft.slots.upper_wear->season = Season::kHot;
    context.climate = Season::kCold;

    const auto result = evaluate_hard_rules(draft, context, RuleConfig{});
    REQUIRE(find_violation(result, rule_ids::kClimateTooLight) != nullptr);
    CHECK_THAT(result.score_penalty, WithinAbs(0.1, 1e-9));

    draft.slots.layering = slot("wool overshirt");
    CHECK(evaluate_hard_rules(draft, context, RuleConfig{}).violations.empty());
  }

  SECTION("no climate, no check") {
    auto draft = casual_outfit();
    draft.slots.layering = slot("heavy coat");
    CHECK(evaluate_hard_rules(draft, context, RuleConfig{}).violations.empty());
  }
}

TEST_CASE("The same wardrobe item in two slots blocks", "[rules][duplicates]") {
  auto draft = casual_outfit();
  draft.slots.upper_wear->item_id = "42";
  draft.slots.layering = slot("same shirt worn open");
  draft.slots.layering->item_id = "42";

  const auto result = evaluate_hard_rules(draft, advisory_context(), RuleConfig{});
  CHECK_FALSE(result.allowed);
  const auto* violation = find_violation(result, rule_ids::kDuplicateItems);
  REQUIRE(violation != nullptr);
  CHECK(violation->evidence == std::vector<std::string>{"42"});
  REQUIRE(violation->slots_involved.size() == 2);
  CHECK(violation->slots_involved[0] == OutfitSlot::kUpperWear);
  CHECK(violation->slots_involved[1] == OutfitSlot::kLayering);
}

TEST_CASE("Visual mode warns about slots with nothing to ground", "[rules][wardrobe]") {
  auto draft = casual_outfit();
  draft.slots.lower_wear->hint = "  ";

  RuleContext context;
  context.response_mode = domain::ResponseMode::kVisualOutfit;
  context.has_wardrobe_items = true;

  const auto result = evaluate_hard_rules(draft, context, RuleConfig{});
  CHECK(result.allowed);
  const auto* violation = find_violation(result, rule_ids::kWardrobeLowerMissing);
  REQUIRE(violation != nullptr);
  CHECK(violation->severity == Severity::kWarn);

  SECTION("an explicit item id is enough") {
    draft.slots.lower_wear->item_id = "2";
    CHECK(evaluate_hard_rules(draft, context, RuleConfig{}).violations.empty());
  }

  SECTION("advisory mode never checks the wardrobe") {
    CHECK(evaluate_hard_rules(draft, advisory_context(), RuleConfig{}).violations.empty());
  }

  SECTION("an empty wardrobe is not checked") {
    context.has_wardrobe_items = false;
    CHECK(evaluate_hard_rules(draft, context, RuleConfig{}).violations.empty());
  }
}

TEST_CASE("Violations are reported in rulebook order", "[rules]") {
  auto draft = casual_outfit();
  draft.slots.footwear.reset();
  draft.slots.upper_wear->item_id = "7";
  draft.slots.lower_wear->item_id = "7";
  draft.slots.upper_wear->silhouette = Silhouette::kLongline;
  draft.slots.lower_wear->silhouette = Silhouette::kOversized;

  const auto result = evaluate_hard_rules(draft, advisory_context(), RuleConfig{});
  REQUIRE(result.violations.size() == 3);
  CHECK(result.violations[0].rule_id == rule_ids::kMandatorySlots);
  CHECK(result.violations[1].rule_id == rule_ids::kSilhouette);
  CHECK(result.violations[2].rule_id == rule_ids::kDuplicateItems);
  CHECK(result.block_count() == 2);
  CHECK(result.warning_count() == 1);
  // Only warnings contribute a penalty.
  CHECK_THAT(result.score_penalty, WithinAbs(0.15, 1e-9));
}

TEST_CASE("Evaluation is deterministic", "[rules]") {
  auto draft = casual_outfit();
  draft.slots.upper_wear->formality = Formality::kFormal;
  draft.slots.footwear->formality = Formality::kCasual;

  const auto first = evaluate_hard_rules(draft, advisory_context(), RuleConfig{});
  const auto second = evaluate_hard_rules(draft, advisory_context(), RuleConfig{});
  CHECK(first == second);
}

TEST_CASE("A custom rulebook runs only its rules", "[rules]") {
  Rulebook rulebook;
  rulebook.rules.push_back(std::make_unique<MandatorySlotsRule>());
  rulebook.rules.push_back(std::make_unique<AlwaysBlockRule>());
  const HardRuleEvaluator evaluator(std::move(rulebook));

  const auto result = evaluator.evaluate(casual_outfit(), advisory_context(), RuleConfig{});
  CHECK_FALSE(result.allowed);
  REQUIRE(result.violations.size() == 1);
  CHECK(result.violations[0].rule_id == "always_block");
}
