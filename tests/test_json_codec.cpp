#include "stylegate/io/json_codec.h"
#include "stylegate/rules/rule_ids.h"

#include <catch2/catch_test_macros.hpp>

#include "styling_fixtures.h"

#include <nlohmann/json.hpp>

#include <string>

using namespace stylegate;
using namespace stylegate::io;
using json = nlohmann::json;

TEST_CASE("Wardrobe records decode tolerantly", "[io][wardrobe]") {
  const auto item = wardrobe_item_from_json(json{{"id", 17},
                                                 {"name", "Linen Shirt"},
                                                 {"itemType", "Shirt"},
                                                 {"primaryColor", "Sand"},
                                                 {"seasons", "summer"},
                                                 {"style_aesthetic", {"minimal", 3, "classic"}},
                                                 {"imageUrl", "https://img/17.png"},
                                                 {"fit", nullptr}});

  CHECK(item.id == "17");
  CHECK(item.name == "Linen Shirt");
  CHECK(item.item_type == "Shirt");
  CHECK(item.primary_color == "Sand");
  CHECK(item.seasons == std::vector<std::string>{"summer"});
  CHECK(item.style_aesthetic == std::vector<std::string>{"minimal", "3", "classic"});
  CHECK(item.image_url == "https://img/17.png");
  CHECK(item.fit.empty());
  CHECK(item.category.empty());
}

TEST_CASE("Outfit drafts decode slots and accessories", "[io][drafts]") {
  const json j = json::parse(R"({
    "id": "o1",
    "title": "Office day",
    "slots": {
      "upper_wear": {"hint": "white shirt", "itemId": 4, "formality": "Smart",
                     "silhouette": "baggy"},
      "lower_wear": {"hint": "grey trousers", "colorFamily": "grey"},
      "footwear": "brown loafers",
      "accessories": {"hint": "leather watch"}
    },
    "whyItWorks": "Clean lines",
    "occasion": "work"
  })");

  const auto draft = outfit_draft_from_json(j);
  CHECK(draft.id == "o1");
  CHECK(draft.why_it_works == "Clean lines");
  CHECK(draft.occasion == std::optional<std::string>{"work"});
  CHECK_FALSE(draft.vibe.has_value());
  CHECK(draft.source == "generator");

  REQUIRE(draft.slots.upper_wear.has_value());
  CHECK(draft.slots.upper_wear->item_id == std::optional<std::string>{"4"});
  CHECK(draft.slots.upper_wear->formality == domain::Formality::kSmart);
  // Unknown enum names decode as absent.
  CHECK_FALSE(draft.slots.upper_wear->silhouette.has_value());
  CHECK(draft.slots.lower_wear->color_family == "grey");
  // A slot that is not an object is treated as missing.
  CHECK_FALSE(draft.slots.footwear.has_value());
  REQUIRE(draft.slots.accessories.size() == 1);
  CHECK(draft.slots.accessories[0].hint == "leather watch");
}

TEST_CASE("Drafts without slots decode as empty outfits", "[io][drafts]") {
  const auto draft = outfit_draft_from_json(json{{"id", "bare"}, {"slots", "none"}});
  CHECK(draft.id == "bare");
  CHECK(draft.slots.items_in_order().empty());
}

TEST_CASE("Document parsers accept bare arrays and wrapped arrays", "[io][documents]") {
  SECTION("wardrobe array") {
    const auto parsed = parse_wardrobe(R"([{"id": "1"}, 5, {"id": "2"}])");
    REQUIRE(parsed.has_value());
    CHECK(parsed.value().size() == 2);
  }

  SECTION("wardrobe under items") {
    const auto parsed = parse_wardrobe(R"({"items": [{"id": "1"}]})");
    REQUIRE(parsed.has_value());
    CHECK(parsed.value()[0].id == "1");
  }

  SECTION("drafts under candidates") {
    const auto parsed = parse_drafts(R"({"candidates": [{"id": "c1"}]})");
    REQUIRE(parsed.has_value());
    CHECK(parsed.value()[0].id == "c1");
  }

  SECTION("syntax errors") {
    const auto parsed = parse_wardrobe("[{");
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error() == "Wardrobe: Invalid JSON");
  }

  SECTION("wrong shape") {
    const auto parsed = parse_drafts(R"({"outfits": {}})");
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error() == "Drafts: expected a JSON array of records");
  }

  SECTION("preferences must be an object") {
    const auto parsed = parse_preferences("[]");
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error() == "Preferences: expected a JSON object");

    const auto ok = parse_preferences(R"({"avoid_pairs": ["socks with sandals"]})");
    REQUIRE(ok.has_value());
    CHECK(ok.value().avoid_pairs.size() == 1);
  }
}

TEST_CASE("Rule context decodes known values only", "[io][context]") {
  const auto context = rule_context_from_json(
      json{{"responseMode", "advisory_text"}, {"climate", "HOT"}, {"formality", "black-tie"}});
  CHECK(context.response_mode == domain::ResponseMode::kAdvisoryText);
  CHECK(context.climate == domain::Season::kHot);
  CHECK_FALSE(context.formality.has_value());
}

TEST_CASE("Pipeline config overlays the keys present", "[io][config]") {
  const auto parsed = pipeline_config_from_json(
      json{{"rules", {{"strictness", "strict"}, {"check_climate", false}}},
           {"ranker", {{"top_n", 5}, {"weights", {{"soft", 1}}}}},
           {"scoring", {{"match_threshold", 0.5}}},
           {"grounding", {{"min_accept_score", 30}}}});

  REQUIRE(parsed.has_value());
  const auto& config = parsed.value();
  CHECK(config.rules.strictness == rules::Strictness::kStrict);
  CHECK_FALSE(config.rules.check_climate);
  CHECK(config.rules.check_formality);
  CHECK(config.ranker.top_n == 5);
  CHECK_FALSE(config.ranker.min_passed.has_value());
  CHECK(config.ranker.weights.soft == 1.0);
  CHECK(config.ranker.weights.hard == 0.4);
  CHECK(config.ranker.scoring.match_threshold == 0.5);
  CHECK(config.grounding.min_accept_score == 30);
}

TEST_CASE("Pipeline config rejects mistyped and unsafe settings", "[io][config]") {
  SECTION("not an object") {
    const auto parsed = pipeline_config_from_json(json::array());
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error() == "Config must be a JSON object");
  }

  SECTION("mistyped field") {
    const auto parsed = pipeline_config_from_json(json{{"ranker", {{"top_n", "three"}}}});
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error() == "Config field 'top_n' must be a non-negative integer");
  }

  SECTION("negative count") {
    const auto parsed = pipeline_config_from_json(json{{"ranker", {{"min_passed", -1}}}});
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error() == "Config field 'min_passed' must be a non-negative integer");
  }

  SECTION("unknown strictness") {
    const auto parsed = pipeline_config_from_json(json{{"rules", {{"strictness", "lenient"}}}});
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error() == "Config field 'strictness' must be one of relaxed, normal, strict");
  }

  SECTION("structural rules cannot be relaxed") {
    const auto parsed = pipeline_config_from_json(
        json{{"ranker", {{"relaxation", json::array({rules::rule_ids::kMandatorySlots})}}}});
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error() == "Rule 'mandatory_slots' cannot be relaxed");
  }

  SECTION("section of the wrong type") {
    const auto parsed = pipeline_config_from_json(json{{"scoring", 1}});
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error() == "Config field 'scoring' must be an object");
  }

  SECTION("syntax error in text") {
    const auto parsed = parse_pipeline_config("{rules:");
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error() == "Config: Invalid JSON");
  }
}

TEST_CASE("Pipeline config survives its own serialization", "[io][config]") {
  app::PipelineConfig config;
  config.rules.strictness = rules::Strictness::kRelaxed;
  config.ranker.min_passed = 2;
  config.ranker.relaxation.demotable_rule_ids = {rules::rule_ids::kEthnicCoherence};
  config.grounding.max_display_items = 3;

  const auto parsed = parse_pipeline_config(pipeline_config_to_json(config).dump());
  REQUIRE(parsed.has_value());
  CHECK(parsed.value() == config);

  const auto defaults = pipeline_config_to_json(app::PipelineConfig{});
  CHECK_FALSE(defaults["ranker"].contains("min_passed"));
}

TEST_CASE("Rule violations serialize with wire names", "[io][results]") {
  const rules::RuleViolation violation{rules::rule_ids::kSilhouette,
                                       rules::Severity::kWarn,
                                       "oversized upper over relaxed lower loses the shape",
                                       {domain::OutfitSlot::kUpperWear,
                                        domain::OutfitSlot::kLowerWear},
                                       {"hoodie", "cargo"},
                                       0.5,
                                       true};

  const json j = rule_violation_to_json(violation);
  CHECK(j["rule_id"] == "silhouette_mismatch");
  CHECK(j["severity"] == "warn");
  CHECK(j["slots_involved"] == json{"upper_wear", "lower_wear"});
  CHECK(j["demoted"] == true);
}

TEST_CASE("Visual outfits serialize layout and layers", "[io][results]") {
  domain::VisualOutfit outfit;
  outfit.draft_id = "draft-1";
  outfit.title = "Easy weekend";
  outfit.layout = domain::Layout::k2x1;
  outfit.items = {{"1", "White T-Shirt", "https://img/1.png", domain::Layer::kTop},
                  {"3", "White Sneakers", "https://img/3.png", domain::Layer::kShoes}};

  const json j = visual_outfit_to_json(outfit);
  CHECK(j["layout"] == "2x1");
  CHECK(j["items"][1]["layer"] == "shoes");
  CHECK_FALSE(j.contains("occasion"));
}
