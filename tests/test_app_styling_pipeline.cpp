#include "stylegate/app/app_service.h"
#include "stylegate/core/clock.h"
#include "stylegate/core/id_generator.h"
#include "stylegate/storage/audit_log.h"

#include <catch2/catch_test_macros.hpp>

#include "styling_fixtures.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace stylegate;
using stylegate::testing::basics_wardrobe;
using stylegate::testing::casual_outfit;

namespace {

app::StylingRequest basics_request() {
  app::StylingRequest req;
  req.wardrobe = basics_wardrobe();
  req.drafts = {casual_outfit("draft-1")};
  return req;
}

}  // namespace

TEST_CASE("app_service: styling pipeline with deterministic components",
          "[app_service][styling][determinism]") {
  // Arrange
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  storage::InMemoryAuditLog audit_log;

  // Act
  const auto response = app::run_styling_pipeline(basics_request(), audit_log, id_gen, clock);

  // Assert: response
  CHECK(response.trace_id == "trace-0");
  CHECK(response.classified.size() == 3);
  CHECK(response.coverage.can_support_visual_outfits);
  CHECK_FALSE(response.diagnostics.coverage_warning.has_value());

  CHECK(response.diagnostics.passed_count == 1);
  CHECK_FALSE(response.diagnostics.needs_fallback);
  CHECK(response.diagnostics.fallback_reason == "Only 1 candidates passed (need 3)");

  REQUIRE(response.outfits.size() == 1);
  const auto& outfit = response.outfits[0];
  CHECK(outfit.draft_id == "draft-1");
  CHECK(outfit.layout == domain::Layout::k3x1);
  REQUIRE(outfit.items.size() == 3);
  CHECK(outfit.items[0].id == "1");
  CHECK(outfit.items[2].image_url == "https://img/3.png");

  // Assert: audit trail
  const auto events = app::fetch_audit_trace(response.trace_id, audit_log);
  REQUIRE(events.size() == 5);
  CHECK(events[0].event_type == storage::event_types::kRunStarted);
  CHECK(events[1].event_type == storage::event_types::kWardrobeProfiled);
  CHECK(events[2].event_type == storage::event_types::kCandidatesRanked);
  CHECK(events[3].event_type == storage::event_types::kOutfitsGrounded);
  CHECK(events[4].event_type == storage::event_types::kRunCompleted);

  for (std::size_t i = 0; i < events.size(); ++i) {
    CHECK(events[i].event_id == "evt-" + std::to_string(i + 1));
    CHECK(events[i].trace_id == "trace-0");
    CHECK(events[i].created_at == "2026-01-01T00:00:00Z");
  }

  CHECK(events[0].refs == std::vector<std::string>{"draft-1"});
  CHECK(events[2].refs == std::vector<std::string>{"draft-1"});
  CHECK(events[3].refs == std::vector<std::string>{"1", "2", "3"});

  const auto started = nlohmann::json::parse(events[0].payload);
  CHECK(started["wardrobe_items"] == 3);
  CHECK(started["drafts"] == 1);
  CHECK(started["has_preferences"] == false);
  CHECK(started["config_fingerprint"] == app::config_fingerprint(app::PipelineConfig{}));

  const auto completed = nlohmann::json::parse(events[4].payload);
  CHECK(completed["status"] == "success");
}

TEST_CASE("app_service: identical requests replay identically", "[app_service][determinism]") {
  core::FixedClock clock("2026-01-01T00:00:00Z");

  core::DeterministicIdGenerator first_ids;
  storage::InMemoryAuditLog first_log;
  const auto first = app::run_styling_pipeline(basics_request(), first_log, first_ids, clock);

  core::DeterministicIdGenerator second_ids;
  storage::InMemoryAuditLog second_log;
  const auto second = app::run_styling_pipeline(basics_request(), second_log, second_ids, clock);

  CHECK(first.outfits == second.outfits);
  CHECK(first_log.query("") == second_log.query(""));
}

TEST_CASE("app_service: missing footwear is reported as a coverage gap", "[app_service]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  storage::InMemoryAuditLog audit_log;

  auto req = basics_request();
  req.wardrobe.pop_back();

  const auto response = app::run_styling_pipeline(req, audit_log, id_gen, clock);

  REQUIRE(response.diagnostics.coverage_warning.has_value());
  CHECK(*response.diagnostics.coverage_warning ==
        "Your wardrobe has no footwear, so complete outfits cannot be built from it yet.");
  REQUIRE(response.outfits.size() == 1);
  CHECK(response.outfits[0].layout == domain::Layout::k2x1);
}

TEST_CASE("app_service: caller trace id is used", "[app_service]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  storage::InMemoryAuditLog audit_log;

  auto req = basics_request();
  req.trace_id = "trace-custom";

  const auto response = app::run_styling_pipeline(req, audit_log, id_gen, clock);
  CHECK(response.trace_id == "trace-custom");

  const auto events = app::fetch_audit_trace("trace-custom", audit_log);
  REQUIRE(events.size() == 5);
  CHECK(events[0].event_id == "evt-0");
  CHECK(audit_log.list_trace_ids() == std::vector<std::string>{"trace-custom"});
}

TEST_CASE("app_service: no drafts needs a fallback", "[app_service]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  storage::InMemoryAuditLog audit_log;

  auto req = basics_request();
  req.drafts.clear();

  const auto response = app::run_styling_pipeline(req, audit_log, id_gen, clock);
  CHECK(response.outfits.empty());
  CHECK(response.diagnostics.needs_fallback);
  CHECK(response.diagnostics.fallback_reason == "No candidates supplied");

  const auto events = app::fetch_audit_trace(response.trace_id, audit_log);
  REQUIRE(events.size() == 5);
  const auto completed = nlohmann::json::parse(events[4].payload);
  CHECK(completed["status"] == "no_outfits");
  CHECK(completed["needs_fallback"] == true);
}

TEST_CASE("app_service: config fingerprint tracks the configuration", "[app_service][config]") {
  const app::PipelineConfig defaults;
  app::PipelineConfig strict;
  strict.rules.strictness = rules::Strictness::kStrict;

  CHECK(app::config_fingerprint(defaults) == app::config_fingerprint(app::PipelineConfig{}));
  CHECK(app::config_fingerprint(defaults) != app::config_fingerprint(strict));
  CHECK(app::config_fingerprint(defaults).size() == 16);
}

TEST_CASE("app_service: preferences steer the ranking", "[app_service]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");
  storage::InMemoryAuditLog audit_log;

  auto loafers = casual_outfit("loafers");
  loafers.slots.footwear = stylegate::testing::slot("brown leather loafers", "footwear", "loafers");

  auto req = basics_request();
  req.drafts.push_back(loafers);
  req.preferences = scoring::PreferenceSet{};
  req.preferences->valid_pairs = {"leather loafers"};

  const auto response = app::run_styling_pipeline(req, audit_log, id_gen, clock);
  REQUIRE(response.ranking.ranked.size() == 2);
  CHECK(response.ranking.ranked[0].draft.id == "loafers");

  const auto started = nlohmann::json::parse(audit_log.query(response.trace_id)[0].payload);
  CHECK(started["has_preferences"] == true);
}
