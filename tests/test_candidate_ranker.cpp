#include "stylegate/ranking/candidate_ranker.h"
#include "stylegate/rules/rule_ids.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "styling_fixtures.h"

#include <string>
#include <vector>

using namespace stylegate;
using namespace stylegate::ranking;
using Catch::Matchers::WithinAbs;
using stylegate::testing::casual_outfit;
using stylegate::testing::slot;

namespace {

rules::RuleContext advisory_context() {
  rules::RuleContext context;
  context.response_mode = domain::ResponseMode::kAdvisoryText;
  return context;
}

rules::RuleContext formal_context() {
  auto context = advisory_context();
  context.formality = domain::Formality::kFormal;
  return context;
}

domain::OutfitDraft track_pants_outfit(const std::string& id) {
  auto draft = casual_outfit(id);
  draft.slots.lower_wear = slot("navy track pants", "sportswear", "track-pants");
  return draft;
}

domain::OutfitDraft incomplete_outfit(const std::string& id) {
  auto draft = casual_outfit(id);
  draft.slots.footwear.reset();
  return draft;
}

std::vector<std::string> ranked_ids(const RankingResult& result) {
  std::vector<std::string> ids;
  for (const auto& evaluation : result.ranked) {
    ids.push_back(evaluation.draft.id);
  }
  return ids;
}

}  // namespace

TEST_CASE("combined_score blends the three signals", "[ranking]") {
  const RankWeights weights;
  CHECK_THAT(combined_score(0.0, 0.5, 0.5, weights), WithinAbs(0.7, 1e-9));
  CHECK_THAT(combined_score(0.2, 0.5, 0.5, weights), WithinAbs(0.62, 1e-9));
  // Penalty beyond 1 clamps the hard component at zero.
  CHECK_THAT(combined_score(3.0, 1.0, 1.0, weights), WithinAbs(0.6, 1e-9));
  CHECK_THAT(combined_score(0.0, 1.0, 1.0, RankWeights{0.0, 0.0, 0.0}), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Equal scores keep input order", "[ranking]") {
  const CandidateRanker ranker;
  const std::vector<domain::OutfitDraft> drafts = {casual_outfit("c"), casual_outfit("a"),
                                                   casual_outfit("b")};

  const auto result = ranker.rank(drafts, advisory_context(), rules::RuleConfig{}, {});
  CHECK(ranked_ids(result) == std::vector<std::string>{"c", "a", "b"});
  CHECK(result.passed_count == 3);
  CHECK_FALSE(result.needs_fallback);
  CHECK_FALSE(result.fallback_reason.has_value());
}

TEST_CASE("Warnings lower the rank", "[ranking]") {
  auto warned = casual_outfit("warned");
  warned.slots.upper_wear->formality = domain::Formality::kCasual;
  warned.slots.footwear->formality = domain::Formality::kFormal;

  const CandidateRanker ranker;
  const auto result = ranker.rank({warned, casual_outfit("clean")}, advisory_context(),
                                  rules::RuleConfig{}, {});

  CHECK(ranked_ids(result) == std::vector<std::string>{"clean", "warned"});
  CHECK_THAT(result.ranked[0].combined_score, WithinAbs(0.7, 1e-9));
  CHECK_THAT(result.ranked[1].combined_score, WithinAbs(0.62, 1e-9));
  CHECK(result.warning_count == 1);
}

TEST_CASE("Soft preferences reorder allowed drafts", "[ranking]") {
  auto loafers = casual_outfit("loafers");
  loafers.slots.footwear = slot("brown leather loafers", "footwear", "loafers");

  const std::vector<scoring::SoftRule> soft_rules = {
      {"p1", scoring::SoftRuleType::kPrefer, "leather loafers", 1.0, ""}};

  const CandidateRanker ranker;
  const auto result = ranker.rank({casual_outfit("sneakers"), loafers}, advisory_context(),
                                  rules::RuleConfig{}, soft_rules);
  REQUIRE(result.ranked.size() == 2);
  CHECK(result.ranked[0].draft.id == "loafers");
  CHECK(result.ranked[0].soft.matched_rules == std::vector<std::string>{"p1"});
}

TEST_CASE("Ranking is deterministic", "[ranking]") {
  const CandidateRanker ranker;
  const std::vector<domain::OutfitDraft> drafts = {casual_outfit("1"), track_pants_outfit("2"),
                                                   incomplete_outfit("3")};

  const auto first = ranker.rank(drafts, formal_context(), rules::RuleConfig{}, {});
  const auto second = ranker.rank(drafts, formal_context(), rules::RuleConfig{}, {});
  CHECK(ranked_ids(first) == ranked_ids(second));
  CHECK(first.summary == second.summary);
  CHECK(first.fallback_reason == second.fallback_reason);
}

TEST_CASE("Relaxation rescues demotable blocks when too few pass", "[ranking][relaxation]") {
  const std::vector<domain::OutfitDraft> drafts = {track_pants_outfit("track"),
                                                   casual_outfit("clean")};

  SECTION("enabled") {
    const CandidateRanker ranker;
    const auto result = ranker.rank(drafts, formal_context(), rules::RuleConfig{}, {});

    CHECK(result.passed_count == 1);
    CHECK(result.rescued_count == 1);
    CHECK(result.blocked_count == 0);
    CHECK(ranked_ids(result) == std::vector<std::string>{"clean", "track"});
    CHECK(result.ranked[1].rescued);
    CHECK_THAT(result.ranked[1].combined_score, WithinAbs(0.54, 1e-9));
    CHECK_FALSE(result.needs_fallback);
    CHECK(result.fallback_reason == "Only 1 candidates passed (need 3); relaxed rules rescued 1");
  }

  SECTION("disabled") {
    RankerConfig config;
    config.enable_relaxation = false;
    const CandidateRanker ranker(config);
    const auto result = ranker.rank(drafts, formal_context(), rules::RuleConfig{}, {});

    CHECK(result.rescued_count == 0);
    CHECK(result.blocked_count == 1);
    CHECK(ranked_ids(result) == std::vector<std::string>{"clean"});
    CHECK(result.fallback_reason == "Only 1 candidates passed (need 3)");
  }

  SECTION("enough passed already") {
    RankerConfig config;
    config.min_passed = 1;
    const CandidateRanker ranker(config);
    const auto result = ranker.rank(drafts, formal_context(), rules::RuleConfig{}, {});

    CHECK(result.rescued_count == 0);
    CHECK(result.blocked_count == 1);
    CHECK_FALSE(result.fallback_reason.has_value());
  }
}

TEST_CASE("Missing slots are never rescued", "[ranking][relaxation]") {
  RankerConfig config;
  config.relaxation.demotable_rule_ids.insert(rules::rule_ids::kMandatorySlots);
  const CandidateRanker ranker(config);

  const auto result =
      ranker.rank({incomplete_outfit("no-shoes")}, advisory_context(), rules::RuleConfig{}, {});

  CHECK(result.ranked.empty());
  REQUIRE(result.blocked.size() == 1);
  CHECK_FALSE(result.blocked[0].is_complete);
  REQUIRE(result.blocked[0].missing_slots.size() == 1);
  CHECK(result.blocked[0].missing_slots[0] == domain::OutfitSlot::kFootwear);
  CHECK(result.needs_fallback);
  CHECK(result.fallback_reason == "All candidates failed hard rules");
  CHECK(result.summary.blocking ==
        std::vector<std::string>{rules::rule_ids::kMandatorySlots});
}

TEST_CASE("Empty input needs a fallback", "[ranking]") {
  const CandidateRanker ranker;
  const auto result = ranker.rank({}, advisory_context(), rules::RuleConfig{}, {});
  CHECK(result.needs_fallback);
  CHECK(result.fallback_reason == "No candidates supplied");
  CHECK(result.top_outfits(3).empty());
}

TEST_CASE("Violation summary counts by rule and slot", "[ranking]") {
  const CandidateRanker ranker;
  const auto result = ranker.rank({incomplete_outfit("a"), incomplete_outfit("b")},
                                  advisory_context(), rules::RuleConfig{}, {});

  CHECK(result.summary.by_rule.at(rules::rule_ids::kMandatorySlots) == 2);
  CHECK(result.summary.by_slot.at(domain::OutfitSlot::kFootwear) == 2);
  CHECK(result.summary.blocking.size() == 1);
}

TEST_CASE("top_outfits truncates to top_n", "[ranking]") {
  const CandidateRanker ranker;
  const auto result = ranker.rank({casual_outfit("1"), casual_outfit("2"), casual_outfit("3"),
                                   casual_outfit("4")},
                                  advisory_context(), rules::RuleConfig{}, {});
  const auto top = result.top_outfits(ranker.config().top_n);
  REQUIRE(top.size() == 3);
  CHECK(top[0].id == "1");
  CHECK(top[2].id == "3");
}
