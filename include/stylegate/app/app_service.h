#pragma once

#include "stylegate/app/pipeline_config.h"
#include "stylegate/core/clock.h"
#include "stylegate/core/id_generator.h"
#include "stylegate/coverage/coverage_profiler.h"
#include "stylegate/domain/classified_item.h"
#include "stylegate/domain/outfit_draft.h"
#include "stylegate/domain/visual_outfit.h"
#include "stylegate/domain/wardrobe_item.h"
#include "stylegate/ranking/candidate_ranker.h"
#include "stylegate/rules/rule_context.h"
#include "stylegate/scoring/soft_rule.h"
#include "stylegate/storage/audit_event.h"
#include "stylegate/storage/audit_log.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace stylegate::app {

// ────────────────────────────────────────────────────────────────
// Styling Pipeline
// ────────────────────────────────────────────────────────────────

struct StylingRequest {
  std::vector<domain::WardrobeItem> wardrobe;
  std::vector<domain::OutfitDraft> drafts;

  // has_wardrobe_items is derived from wardrobe; the supplied value is ignored.
  rules::RuleContext context;

  // Defaults to the built-in soft rules when absent
  std::optional<scoring::PreferenceSet> preferences;
  std::vector<domain::AestheticTag> target_aesthetics;

  PipelineConfig config;

  // Optional trace_id (generated when absent)
  std::optional<std::string> trace_id;
};

struct PipelineDiagnostics {
  std::size_t passed_count{0};
  std::size_t blocked_count{0};
  std::size_t rescued_count{0};
  std::size_t warning_count{0};
  bool needs_fallback{false};
  std::optional<std::string> fallback_reason;
  std::optional<std::string> coverage_warning;
  std::size_t dropped_outfit_count{0};
};

struct StylingResponse {
  std::string trace_id;
  std::vector<domain::ClassifiedItem> classified;
  coverage::CoverageProfile coverage;
  ranking::RankingResult ranking;
  std::vector<domain::VisualOutfit> outfits;
  PipelineDiagnostics diagnostics;
};

// Classify -> profile coverage -> rank drafts -> ground the top-N.
// Emits audit events: RunStarted, WardrobeProfiled, CandidatesRanked, OutfitsGrounded,
// RunCompleted. Never throws for malformed drafts or wardrobe records.
[[nodiscard]] StylingResponse run_styling_pipeline(const StylingRequest& req,
                                                   storage::IAuditLog& audit_log,
                                                   core::IIdGenerator& id_gen,
                                                   core::IClock& clock);

// config_fingerprint hashes the deterministic JSON form of the configuration.
[[nodiscard]] std::string config_fingerprint(const PipelineConfig& config);

// ────────────────────────────────────────────────────────────────
// Audit Trace
// ────────────────────────────────────────────────────────────────

[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(
    const std::string& trace_id, const storage::IAuditLog& audit_log);

}  // namespace stylegate::app
