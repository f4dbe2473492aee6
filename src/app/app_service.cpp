#include "stylegate/app/app_service.h"

#include "stylegate/core/hashing.h"
#include "stylegate/grounding/image_resolver.h"
#include "stylegate/io/json_codec.h"
#include "stylegate/taxonomy/item_classifier.h"

#include <nlohmann/json.hpp>

namespace stylegate::app {

namespace {

std::vector<std::string> draft_ids(const std::vector<domain::OutfitDraft>& drafts) {
  std::vector<std::string> ids;
  ids.reserve(drafts.size());
  for (const auto& draft : drafts) {
    ids.push_back(draft.id);
  }
  return ids;
}

}  // namespace

StylingResponse run_styling_pipeline(const StylingRequest& req, storage::IAuditLog& audit_log,
                                     core::IIdGenerator& id_gen, core::IClock& clock) {
  const std::string trace_id = req.trace_id ? *req.trace_id : id_gen.next("trace");

  nlohmann::json started;
  started["config_fingerprint"] = config_fingerprint(req.config);
  started["wardrobe_items"] = req.wardrobe.size();
  started["drafts"] = req.drafts.size();
  started["has_preferences"] = req.preferences.has_value();
  audit_log.append({id_gen.next("evt"),
                    trace_id,
                    storage::event_types::kRunStarted,
                    started.dump(),
                    clock.now_iso8601(),
                    draft_ids(req.drafts)});

  // Classify and profile the wardrobe
  StylingResponse response;
  response.trace_id = trace_id;
  response.classified = taxonomy::classify_wardrobe(req.wardrobe);
  response.coverage = coverage::build_coverage_profile(response.classified);
  response.diagnostics.coverage_warning = coverage::describe_gaps(response.coverage);

  audit_log.append({id_gen.next("evt"),
                    trace_id,
                    storage::event_types::kWardrobeProfiled,
                    io::coverage_profile_to_json(response.coverage).dump(),
                    clock.now_iso8601(),
                    {}});

  // Rank candidates
  rules::RuleContext context = req.context;
  context.has_wardrobe_items = !req.wardrobe.empty();

  const ranking::CandidateRanker ranker(req.config.ranker);
  response.ranking = ranker.rank(req.drafts, context, req.config.rules,
                                 scoring::soft_rules_for(req.preferences), req.target_aesthetics);

  const auto& ranking = response.ranking;
  nlohmann::json ranked;
  ranked["passed_count"] = ranking.passed_count;
  ranked["rescued_count"] = ranking.rescued_count;
  ranked["blocked_count"] = ranking.blocked_count;
  ranked["warning_count"] = ranking.warning_count;
  ranked["needs_fallback"] = ranking.needs_fallback;
  if (ranking.fallback_reason) {
    ranked["fallback_reason"] = *ranking.fallback_reason;
  }
  ranked["blocking_rules"] = ranking.summary.blocking;
  const auto top = ranking.top_outfits(req.config.ranker.top_n);
  audit_log.append({id_gen.next("evt"),
                    trace_id,
                    storage::event_types::kCandidatesRanked,
                    ranked.dump(),
                    clock.now_iso8601(),
                    draft_ids(top)});

  // Ground the top-N against the classified wardrobe
  auto grounded = grounding::resolve_outfits(top, response.classified, req.config.grounding);
  response.outfits = std::move(grounded.outfits);

  std::vector<std::string> grounded_item_ids;
  for (const auto& outfit : response.outfits) {
    for (const auto& item : outfit.items) {
      grounded_item_ids.push_back(item.id);
    }
  }
  nlohmann::json grounded_payload;
  grounded_payload["visual_outfits"] = response.outfits.size();
  grounded_payload["dropped"] = grounded.dropped_count;
  audit_log.append({id_gen.next("evt"),
                    trace_id,
                    storage::event_types::kOutfitsGrounded,
                    grounded_payload.dump(),
                    clock.now_iso8601(),
                    grounded_item_ids});

  auto& diagnostics = response.diagnostics;
  diagnostics.passed_count = ranking.passed_count;
  diagnostics.blocked_count = ranking.blocked_count;
  diagnostics.rescued_count = ranking.rescued_count;
  diagnostics.warning_count = ranking.warning_count;
  diagnostics.needs_fallback = ranking.needs_fallback;
  diagnostics.fallback_reason = ranking.fallback_reason;
  diagnostics.dropped_outfit_count = grounded.dropped_count;

  nlohmann::json completed;
  completed["status"] = response.outfits.empty() ? "no_outfits" : "success";
  completed["needs_fallback"] = diagnostics.needs_fallback;
  audit_log.append({id_gen.next("evt"),
                    trace_id,
                    storage::event_types::kRunCompleted,
                    completed.dump(),
                    clock.now_iso8601(),
                    {}});

  return response;
}

std::string config_fingerprint(const PipelineConfig& config) {
  return core::stable_hash64_hex(io::pipeline_config_to_json(config).dump());
}

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   const storage::IAuditLog& audit_log) {
  return audit_log.query(trace_id);
}

}  // namespace stylegate::app
