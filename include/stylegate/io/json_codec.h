#pragma once

#include "stylegate/app/app_service.h"
#include "stylegate/app/pipeline_config.h"
#include "stylegate/core/result.h"
#include "stylegate/coverage/coverage_profiler.h"
#include "stylegate/domain/classified_item.h"
#include "stylegate/domain/outfit_draft.h"
#include "stylegate/domain/visual_outfit.h"
#include "stylegate/domain/wardrobe_item.h"
#include "stylegate/ranking/candidate_ranker.h"
#include "stylegate/rules/hard_rule_evaluator.h"
#include "stylegate/rules/rule_context.h"
#include "stylegate/scoring/soft_rule.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace stylegate::io {

// Record decoders are tolerant: a missing or mistyped field decodes as empty so that
// malformed candidate input still reaches the evaluator. Ids may be strings or numbers.
// Slot keys accept both snake_case and camelCase ("item_id" / "itemId").

[[nodiscard]] domain::WardrobeItem wardrobe_item_from_json(const nlohmann::json& j);
[[nodiscard]] nlohmann::json wardrobe_item_to_json(const domain::WardrobeItem& item);

[[nodiscard]] domain::SlotItem slot_item_from_json(const nlohmann::json& j);
[[nodiscard]] nlohmann::json slot_item_to_json(const domain::SlotItem& item);

// accessories may be a single object or a list.
[[nodiscard]] domain::OutfitDraft outfit_draft_from_json(const nlohmann::json& j);
[[nodiscard]] nlohmann::json outfit_draft_to_json(const domain::OutfitDraft& draft);

[[nodiscard]] scoring::PreferenceSet preference_set_from_json(const nlohmann::json& j);
[[nodiscard]] rules::RuleContext rule_context_from_json(const nlohmann::json& j);

// Overlays the keys present in j onto base. Unknown enum names and mistyped values are
// errors, since a silently ignored setting would change results.
[[nodiscard]] core::Result<app::PipelineConfig, std::string> pipeline_config_from_json(
    const nlohmann::json& j, const app::PipelineConfig& base = app::PipelineConfig{});
[[nodiscard]] nlohmann::json pipeline_config_to_json(const app::PipelineConfig& config);

[[nodiscard]] nlohmann::json classified_item_to_json(const domain::ClassifiedItem& item);
[[nodiscard]] nlohmann::json coverage_profile_to_json(const coverage::CoverageProfile& profile);
[[nodiscard]] nlohmann::json rule_violation_to_json(const rules::RuleViolation& violation);
[[nodiscard]] nlohmann::json hard_rule_result_to_json(const rules::HardRuleResult& result);
[[nodiscard]] nlohmann::json candidate_evaluation_to_json(
    const ranking::CandidateEvaluation& evaluation);
[[nodiscard]] nlohmann::json ranking_result_to_json(const ranking::RankingResult& result);
[[nodiscard]] nlohmann::json visual_outfit_to_json(const domain::VisualOutfit& outfit);
[[nodiscard]] nlohmann::json diagnostics_to_json(const app::PipelineDiagnostics& diagnostics);
[[nodiscard]] nlohmann::json styling_response_to_json(const app::StylingResponse& response);

// Document-level parsers. Syntax errors and wrong top-level shapes are errors.

[[nodiscard]] core::Result<nlohmann::json, std::string> parse_json_text(std::string_view text);

// A JSON array, or an object holding the array under "items" or "wardrobe".
[[nodiscard]] core::Result<std::vector<domain::WardrobeItem>, std::string> parse_wardrobe(
    std::string_view text);

// A JSON array, or an object holding the array under "outfits", "drafts" or "candidates".
[[nodiscard]] core::Result<std::vector<domain::OutfitDraft>, std::string> parse_drafts(
    std::string_view text);

[[nodiscard]] core::Result<scoring::PreferenceSet, std::string> parse_preferences(
    std::string_view text);

[[nodiscard]] core::Result<app::PipelineConfig, std::string> parse_pipeline_config(
    std::string_view text, const app::PipelineConfig& base = app::PipelineConfig{});

}  // namespace stylegate::io
