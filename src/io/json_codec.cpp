#include "stylegate/io/json_codec.h"

#include "stylegate/core/normalization.h"
#include "stylegate/rules/rule_context.h"

#include <initializer_list>
#include <utility>

namespace stylegate::io {

using json = nlohmann::json;

namespace {

std::string str(const std::string_view value) {
  return std::string(value);
}

const json* find_field(const json& j, const char* key) {
  if (!j.is_object()) {
    return nullptr;
  }
  const auto it = j.find(key);
  return it == j.end() ? nullptr : &*it;
}

// Strings pass through; numbers are rendered (numeric ids); anything else is empty.
std::string scalar_to_string(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_unsigned()) {
    return std::to_string(value.get<unsigned long long>());
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<long long>());
  }
  if (value.is_number_float()) {
    return value.dump();
  }
  return {};
}

std::string string_field(const json& j, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    if (const json* value = find_field(j, key)) {
      std::string text = scalar_to_string(*value);
      if (!text.empty()) {
        return text;
      }
    }
  }
  return {};
}

std::optional<std::string> optional_string_field(const json& j,
                                                 std::initializer_list<const char*> keys) {
  std::string value = string_field(j, keys);
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

// An array of strings, or a single string treated as a one-element list.
std::vector<std::string> string_list_field(const json& j, std::initializer_list<const char*> keys) {
  std::vector<std::string> out;
  for (const char* key : keys) {
    const json* value = find_field(j, key);
    if (value == nullptr) {
      continue;
    }
    if (value->is_string()) {
      out.push_back(value->get<std::string>());
    } else if (value->is_array()) {
      for (const auto& element : *value) {
        std::string text = scalar_to_string(element);
        if (!text.empty()) {
          out.push_back(std::move(text));
        }
      }
    }
    if (!out.empty()) {
      break;
    }
  }
  return out;
}

template <typename E>
std::vector<std::string> names_of(const std::vector<E>& values) {
  std::vector<std::string> names;
  names.reserve(values.size());
  for (const auto value : values) {
    names.push_back(str(domain::to_string(value)));
  }
  return names;
}

// ConfigReader overlays typed settings and records the first type error.
class ConfigReader {
 public:
  void boolean(const json& obj, const char* key, bool& out) {
    if (const json* v = find_field(obj, key)) {
      if (v->is_boolean()) {
        out = v->get<bool>();
      } else {
        fail(key, "a boolean");
      }
    }
  }

  void number(const json& obj, const char* key, double& out) {
    if (const json* v = find_field(obj, key)) {
      if (v->is_number()) {
        out = v->get<double>();
      } else {
        fail(key, "a number");
      }
    }
  }

  void integer(const json& obj, const char* key, int& out) {
    if (const json* v = find_field(obj, key)) {
      if (v->is_number_integer()) {
        out = v->get<int>();
      } else {
        fail(key, "an integer");
      }
    }
  }

  void count(const json& obj, const char* key, std::size_t& out) {
    if (const json* v = find_field(obj, key)) {
      // Parsed text yields unsigned numbers; values built in code are signed.
      if (v->is_number_unsigned() || (v->is_number_integer() && v->get<long long>() >= 0)) {
        out = v->get<std::size_t>();
      } else {
        fail(key, "a non-negative integer");
      }
    }
  }

  const json& section(const json& root, const char* key) {
    static const json kEmpty = json::object();
    const json* v = find_field(root, key);
    if (v == nullptr) {
      return kEmpty;
    }
    if (!v->is_object()) {
      fail(key, "an object");
      return kEmpty;
    }
    return *v;
  }

  void fail(const std::string& key, const std::string& expected) {
    if (error_.empty()) {
      error_ = "Config field '" + key + "' must be " + expected;
    }
  }

  void fail_with(std::string message) {
    if (error_.empty()) {
      error_ = std::move(message);
    }
  }

  [[nodiscard]] bool ok() const { return error_.empty(); }
  [[nodiscard]] const std::string& error() const { return error_; }

 private:
  std::string error_;
};

}  // namespace

// ────────────────────────────────────────────────────────────────
// Input records
// ────────────────────────────────────────────────────────────────

domain::WardrobeItem wardrobe_item_from_json(const json& j) {
  domain::WardrobeItem item;
  item.id = string_field(j, {"id"});
  item.name = string_field(j, {"name"});
  item.category = string_field(j, {"category"});
  item.item_type = string_field(j, {"item_type", "itemType"});
  item.color = string_field(j, {"color"});
  item.primary_color = string_field(j, {"primary_color", "primaryColor"});
  item.fabric = string_field(j, {"fabric"});
  item.fit = string_field(j, {"fit"});
  item.formality = string_field(j, {"formality"});
  item.seasons = string_list_field(j, {"seasons", "season"});
  item.style_aesthetic = string_list_field(j, {"style_aesthetic", "styleAesthetic"});
  item.image_url = string_field(j, {"image_url", "imageUrl"});
  item.processed_image_url = string_field(j, {"processed_image_url", "processedImageUrl"});
  return item;
}

json wardrobe_item_to_json(const domain::WardrobeItem& item) {
  json j;
  j["id"] = item.id;
  j["name"] = item.name;
  j["category"] = item.category;
  j["item_type"] = item.item_type;
  j["color"] = item.color;
  j["primary_color"] = item.primary_color;
  j["fabric"] = item.fabric;
  j["fit"] = item.fit;
  j["formality"] = item.formality;
  j["seasons"] = item.seasons;
  j["style_aesthetic"] = item.style_aesthetic;
  j["image_url"] = item.image_url;
  j["processed_image_url"] = item.processed_image_url;
  return j;
}

domain::SlotItem slot_item_from_json(const json& j) {
  domain::SlotItem item;
  item.hint = string_field(j, {"hint"});
  item.item_id = optional_string_field(j, {"item_id", "itemId"});
  item.category = string_field(j, {"category"});
  item.subcategory = string_field(j, {"subcategory"});
  item.formality = domain::parse_formality(string_field(j, {"formality"}));
  item.silhouette = domain::parse_silhouette(string_field(j, {"silhouette"}));
  item.season = domain::parse_season(string_field(j, {"season"}));
  item.aesthetic_tags = string_list_field(j, {"aesthetic_tags", "aestheticTags"});
  item.color_family = string_field(j, {"color_family", "colorFamily", "color"});
  return item;
}

json slot_item_to_json(const domain::SlotItem& item) {
  json j;
  j["hint"] = item.hint;
  if (item.item_id) {
    j["item_id"] = *item.item_id;
  }
  j["category"] = item.category;
  j["subcategory"] = item.subcategory;
  if (item.formality) {
    j["formality"] = str(domain::to_string(*item.formality));
  }
  if (item.silhouette) {
    j["silhouette"] = str(domain::to_string(*item.silhouette));
  }
  if (item.season) {
    j["season"] = str(domain::to_string(*item.season));
  }
  j["aesthetic_tags"] = item.aesthetic_tags;
  j["color_family"] = item.color_family;
  return j;
}

domain::OutfitDraft outfit_draft_from_json(const json& j) {
  domain::OutfitDraft draft;
  draft.id = string_field(j, {"id"});
  draft.title = string_field(j, {"title"});
  draft.why_it_works = string_field(j, {"why_it_works", "whyItWorks"});
  draft.occasion = optional_string_field(j, {"occasion"});
  draft.vibe = optional_string_field(j, {"vibe"});
  const std::string source = string_field(j, {"source"});
  if (!source.empty()) {
    draft.source = source;
  }

  const json* slots = find_field(j, "slots");
  if (slots == nullptr || !slots->is_object()) {
    return draft;
  }

  const auto single = [&](const char* key) -> std::optional<domain::SlotItem> {
    const json* value = find_field(*slots, key);
    if (value == nullptr || !value->is_object()) {
      return std::nullopt;
    }
    return slot_item_from_json(*value);
  };
  draft.slots.upper_wear = single("upper_wear");
  draft.slots.lower_wear = single("lower_wear");
  draft.slots.footwear = single("footwear");
  draft.slots.layering = single("layering");

  if (const json* accessories = find_field(*slots, "accessories")) {
    if (accessories->is_object()) {
      draft.slots.accessories.push_back(slot_item_from_json(*accessories));
    } else if (accessories->is_array()) {
      for (const auto& element : *accessories) {
        if (element.is_object()) {
          draft.slots.accessories.push_back(slot_item_from_json(element));
        }
      }
    }
  }
  return draft;
}

json outfit_draft_to_json(const domain::OutfitDraft& draft) {
  json slots = json::object();
  const auto put = [&](const char* key, const std::optional<domain::SlotItem>& item) {
    if (item) {
      slots[key] = slot_item_to_json(*item);
    }
  };
  put("upper_wear", draft.slots.upper_wear);
  put("lower_wear", draft.slots.lower_wear);
  put("footwear", draft.slots.footwear);
  put("layering", draft.slots.layering);
  if (!draft.slots.accessories.empty()) {
    json accessories = json::array();
    for (const auto& accessory : draft.slots.accessories) {
      accessories.push_back(slot_item_to_json(accessory));
    }
    slots["accessories"] = accessories;
  }

  json j;
  j["id"] = draft.id;
  j["title"] = draft.title;
  j["slots"] = slots;
  j["why_it_works"] = draft.why_it_works;
  if (draft.occasion) {
    j["occasion"] = *draft.occasion;
  }
  if (draft.vibe) {
    j["vibe"] = *draft.vibe;
  }
  j["source"] = draft.source;
  return j;
}

scoring::PreferenceSet preference_set_from_json(const json& j) {
  scoring::PreferenceSet preferences;
  preferences.valid_pairs = string_list_field(j, {"valid_pairs"});
  preferences.avoid_pairs = string_list_field(j, {"avoid_pairs"});
  preferences.core_directions = string_list_field(j, {"core_directions"});
  preferences.color_rules = string_list_field(j, {"color_rules"});
  preferences.silhouette_rules = string_list_field(j, {"silhouette_rules"});
  preferences.body_type_rules = string_list_field(j, {"body_type_rules"});
  preferences.gender_style_notes = string_list_field(j, {"gender_style_notes"});
  return preferences;
}

rules::RuleContext rule_context_from_json(const json& j) {
  rules::RuleContext context;
  if (const auto mode = domain::parse_response_mode(string_field(j, {"response_mode",
                                                                     "responseMode"}))) {
    context.response_mode = *mode;
  }
  if (const json* has_items = find_field(j, "has_wardrobe_items");
      has_items != nullptr && has_items->is_boolean()) {
    context.has_wardrobe_items = has_items->get<bool>();
  }
  context.climate = domain::parse_season(string_field(j, {"climate"}));
  context.formality = domain::parse_formality(string_field(j, {"formality"}));
  return context;
}

// ────────────────────────────────────────────────────────────────
// Configuration
// ────────────────────────────────────────────────────────────────

core::Result<app::PipelineConfig, std::string> pipeline_config_from_json(
    const json& j, const app::PipelineConfig& base) {
  using ConfigResult = core::Result<app::PipelineConfig, std::string>;
  if (!j.is_object()) {
    return ConfigResult::err("Config must be a JSON object");
  }

  app::PipelineConfig config = base;
  ConfigReader reader;

  const json& rules_json = reader.section(j, "rules");
  reader.boolean(rules_json, "check_formality", config.rules.check_formality);
  reader.boolean(rules_json, "check_silhouette", config.rules.check_silhouette);
  reader.boolean(rules_json, "check_ethnic_coherence", config.rules.check_ethnic_coherence);
  reader.boolean(rules_json, "check_climate", config.rules.check_climate);
  if (const json* strictness = find_field(rules_json, "strictness")) {
    const auto parsed =
        strictness->is_string() ? rules::parse_strictness(strictness->get<std::string>())
                                : std::nullopt;
    if (parsed) {
      config.rules.strictness = *parsed;
    } else {
      reader.fail("strictness", "one of relaxed, normal, strict");
    }
  }

  const json& ranker_json = reader.section(j, "ranker");
  reader.count(ranker_json, "top_n", config.ranker.top_n);
  if (find_field(ranker_json, "min_passed") != nullptr) {
    std::size_t min_passed = config.ranker.effective_min_passed();
    reader.count(ranker_json, "min_passed", min_passed);
    config.ranker.min_passed = min_passed;
  }
  reader.boolean(ranker_json, "enable_relaxation", config.ranker.enable_relaxation);
  if (const json* relaxation = find_field(ranker_json, "relaxation")) {
    if (!relaxation->is_array()) {
      reader.fail("relaxation", "an array of rule ids");
    } else {
      rules::RelaxationPolicy policy;
      for (const auto& id : *relaxation) {
        if (!id.is_string()) {
          reader.fail("relaxation", "an array of rule ids");
          break;
        }
        const std::string rule_id = id.get<std::string>();
        if (!rules::is_demotable_rule(rule_id)) {
          reader.fail_with("Rule '" + rule_id + "' cannot be relaxed");
          break;
        }
        policy.demotable_rule_ids.insert(rule_id);
      }
      config.ranker.relaxation = std::move(policy);
    }
  }
  const json& weights_json = reader.section(ranker_json, "weights");
  reader.number(weights_json, "hard", config.ranker.weights.hard);
  reader.number(weights_json, "soft", config.ranker.weights.soft);
  reader.number(weights_json, "aesthetic", config.ranker.weights.aesthetic);

  const json& scoring_json = reader.section(j, "scoring");
  auto& scoring = config.ranker.scoring;
  reader.number(scoring_json, "match_threshold", scoring.match_threshold);
  reader.number(scoring_json, "avoid_penalty_multiplier", scoring.avoid_penalty_multiplier);
  reader.number(scoring_json, "unmatched_prefer_credit", scoring.unmatched_prefer_credit);
  reader.number(scoring_json, "unmatched_avoid_credit", scoring.unmatched_avoid_credit);
  reader.count(scoring_json, "min_token_length", scoring.min_token_length);
  reader.number(scoring_json, "neutral_score", scoring.neutral_score);

  const json& grounding_json = reader.section(j, "grounding");
  auto& grounding = config.grounding;
  reader.integer(grounding_json, "name_match", grounding.name_match);
  reader.integer(grounding_json, "name_word_match", grounding.name_word_match);
  reader.integer(grounding_json, "color_match", grounding.color_match);
  reader.integer(grounding_json, "category_match", grounding.category_match);
  reader.integer(grounding_json, "item_type_match", grounding.item_type_match);
  reader.integer(grounding_json, "fabric_match", grounding.fabric_match);
  reader.integer(grounding_json, "fit_match", grounding.fit_match);
  reader.integer(grounding_json, "aesthetic_match", grounding.aesthetic_match);
  reader.count(grounding_json, "min_name_word_length", grounding.min_name_word_length);
  reader.integer(grounding_json, "min_accept_score", grounding.min_accept_score);
  reader.count(grounding_json, "max_display_items", grounding.max_display_items);

  if (!reader.ok()) {
    return ConfigResult::err(reader.error());
  }
  return ConfigResult::ok(std::move(config));
}

json pipeline_config_to_json(const app::PipelineConfig& config) {
  // nlohmann::json objects are std::map-backed, so keys serialize in sorted order.
  json rules_json;
  rules_json["check_formality"] = config.rules.check_formality;
  rules_json["check_silhouette"] = config.rules.check_silhouette;
  rules_json["check_ethnic_coherence"] = config.rules.check_ethnic_coherence;
  rules_json["check_climate"] = config.rules.check_climate;
  rules_json["strictness"] = str(rules::to_string(config.rules.strictness));

  json ranker_json;
  ranker_json["top_n"] = config.ranker.top_n;
  if (config.ranker.min_passed) {
    ranker_json["min_passed"] = *config.ranker.min_passed;
  }
  ranker_json["enable_relaxation"] = config.ranker.enable_relaxation;
  ranker_json["relaxation"] = config.ranker.relaxation.demotable_rule_ids;
  ranker_json["weights"] = {{"hard", config.ranker.weights.hard},
                            {"soft", config.ranker.weights.soft},
                            {"aesthetic", config.ranker.weights.aesthetic}};

  const auto& scoring = config.ranker.scoring;
  json scoring_json;
  scoring_json["match_threshold"] = scoring.match_threshold;
  scoring_json["avoid_penalty_multiplier"] = scoring.avoid_penalty_multiplier;
  scoring_json["unmatched_prefer_credit"] = scoring.unmatched_prefer_credit;
  scoring_json["unmatched_avoid_credit"] = scoring.unmatched_avoid_credit;
  scoring_json["min_token_length"] = scoring.min_token_length;
  scoring_json["neutral_score"] = scoring.neutral_score;

  const auto& grounding = config.grounding;
  json grounding_json;
  grounding_json["name_match"] = grounding.name_match;
  grounding_json["name_word_match"] = grounding.name_word_match;
  grounding_json["color_match"] = grounding.color_match;
  grounding_json["category_match"] = grounding.category_match;
  grounding_json["item_type_match"] = grounding.item_type_match;
  grounding_json["fabric_match"] = grounding.fabric_match;
  grounding_json["fit_match"] = grounding.fit_match;
  grounding_json["aesthetic_match"] = grounding.aesthetic_match;
  grounding_json["min_name_word_length"] = grounding.min_name_word_length;
  grounding_json["min_accept_score"] = grounding.min_accept_score;
  grounding_json["max_display_items"] = grounding.max_display_items;

  json j;
  j["rules"] = rules_json;
  j["ranker"] = ranker_json;
  j["scoring"] = scoring_json;
  j["grounding"] = grounding_json;
  return j;
}

// ────────────────────────────────────────────────────────────────
// Results
// ────────────────────────────────────────────────────────────────

json classified_item_to_json(const domain::ClassifiedItem& item) {
  json j;
  j["id"] = item.id;
  j["name"] = item.name;
  j["category"] = str(domain::to_string(item.category));
  j["subcategory"] = item.subcategory;
  j["silhouette"] = str(domain::to_string(item.silhouette));
  j["formality"] = str(domain::to_string(item.formality));
  j["season"] = str(domain::to_string(item.season));
  j["aesthetic_tags"] = names_of(item.aesthetic_tags);
  j["color_family"] = item.color_family;
  j["has_image"] = item.has_image;
  if (item.has_image) {
    j["image_url"] = item.source.image_url;
  }
  return j;
}

json coverage_profile_to_json(const coverage::CoverageProfile& profile) {
  json by_category = json::object();
  for (const auto& [category, entry] : profile.by_category) {
    by_category[str(domain::to_string(category))] = {
        {"count", entry.count},
        {"with_images", entry.with_images},
        {"level", str(coverage::to_string(entry.level))}};
  }

  json j;
  j["by_category"] = by_category;
  j["total_items"] = profile.total_items;
  j["total_with_images"] = profile.total_with_images;
  j["available_slots"] = names_of(profile.available_slots);
  j["missing_mandatory_slots"] = names_of(profile.missing_mandatory_slots);
  j["can_create_complete_outfit"] = profile.can_create_complete_outfit;
  j["can_support_visual_outfits"] = profile.can_support_visual_outfits;
  j["wardrobe_confidence_score"] = profile.wardrobe_confidence_score;
  if (const auto gaps = coverage::describe_gaps(profile)) {
    j["gaps"] = *gaps;
  }
  return j;
}

json rule_violation_to_json(const rules::RuleViolation& violation) {
  json j;
  j["rule_id"] = violation.rule_id;
  j["severity"] = str(rules::to_string(violation.severity));
  j["message"] = violation.message;
  j["slots_involved"] = names_of(violation.slots_involved);
  j["evidence"] = violation.evidence;
  j["penalty"] = violation.penalty;
  j["demoted"] = violation.demoted;
  return j;
}

json hard_rule_result_to_json(const rules::HardRuleResult& result) {
  json violations = json::array();
  for (const auto& violation : result.violations) {
    violations.push_back(rule_violation_to_json(violation));
  }

  json j;
  j["allowed"] = result.allowed;
  j["violations"] = violations;
  j["score_penalty"] = result.score_penalty;
  return j;
}

json candidate_evaluation_to_json(const ranking::CandidateEvaluation& evaluation) {
  json j;
  j["draft_id"] = evaluation.draft.id;
  j["title"] = evaluation.draft.title;
  j["input_index"] = evaluation.input_index;
  j["allowed"] = evaluation.allowed();
  j["rescued"] = evaluation.rescued;
  j["is_complete"] = evaluation.is_complete;
  j["missing_slots"] = names_of(evaluation.missing_slots);
  j["hard_rules"] = hard_rule_result_to_json(evaluation.hard_result);
  j["soft_score"] = evaluation.soft.score;
  j["matched_soft_rules"] = evaluation.soft.matched_rules;
  j["soft_violations"] = evaluation.soft.violations;
  j["aesthetic_score"] = evaluation.aesthetic_score;
  j["combined_score"] = evaluation.combined_score;
  return j;
}

json ranking_result_to_json(const ranking::RankingResult& result) {
  json ranked = json::array();
  for (const auto& evaluation : result.ranked) {
    ranked.push_back(candidate_evaluation_to_json(evaluation));
  }
  json blocked = json::array();
  for (const auto& evaluation : result.blocked) {
    blocked.push_back(candidate_evaluation_to_json(evaluation));
  }

  json by_slot = json::object();
  for (const auto& [slot, count] : result.summary.by_slot) {
    by_slot[str(domain::to_string(slot))] = count;
  }

  json j;
  j["ranked"] = ranked;
  j["blocked"] = blocked;
  j["passed_count"] = result.passed_count;
  j["rescued_count"] = result.rescued_count;
  j["blocked_count"] = result.blocked_count;
  j["warning_count"] = result.warning_count;
  j["needs_fallback"] = result.needs_fallback;
  if (result.fallback_reason) {
    j["fallback_reason"] = *result.fallback_reason;
  }
  j["violation_summary"] = {{"by_rule", result.summary.by_rule},
                            {"by_slot", by_slot},
                            {"blocking", result.summary.blocking}};
  return j;
}

json visual_outfit_to_json(const domain::VisualOutfit& outfit) {
  json items = json::array();
  for (const auto& item : outfit.items) {
    items.push_back({{"id", item.id},
                     {"name", item.name},
                     {"image_url", item.image_url},
                     {"layer", str(domain::to_string(item.layer))}});
  }

  json j;
  j["draft_id"] = outfit.draft_id;
  j["title"] = outfit.title;
  j["layout"] = str(domain::to_string(outfit.layout));
  j["items"] = items;
  j["why_it_works"] = outfit.why_it_works;
  if (outfit.occasion) {
    j["occasion"] = *outfit.occasion;
  }
  if (outfit.vibe) {
    j["vibe"] = *outfit.vibe;
  }
  return j;
}

json diagnostics_to_json(const app::PipelineDiagnostics& diagnostics) {
  json j;
  j["passed_count"] = diagnostics.passed_count;
  j["blocked_count"] = diagnostics.blocked_count;
  j["rescued_count"] = diagnostics.rescued_count;
  j["warning_count"] = diagnostics.warning_count;
  j["needs_fallback"] = diagnostics.needs_fallback;
  if (diagnostics.fallback_reason) {
    j["fallback_reason"] = *diagnostics.fallback_reason;
  }
  if (diagnostics.coverage_warning) {
    j["coverage_warning"] = *diagnostics.coverage_warning;
  }
  j["dropped_outfit_count"] = diagnostics.dropped_outfit_count;
  return j;
}

json styling_response_to_json(const app::StylingResponse& response) {
  json outfits = json::array();
  for (const auto& outfit : response.outfits) {
    outfits.push_back(visual_outfit_to_json(outfit));
  }

  json j;
  j["trace_id"] = response.trace_id;
  j["coverage"] = coverage_profile_to_json(response.coverage);
  j["ranking"] = ranking_result_to_json(response.ranking);
  j["outfits"] = outfits;
  j["diagnostics"] = diagnostics_to_json(response.diagnostics);
  return j;
}

// ────────────────────────────────────────────────────────────────
// Documents
// ────────────────────────────────────────────────────────────────

core::Result<json, std::string> parse_json_text(const std::string_view text) {
  json parsed = json::parse(text.begin(), text.end(), nullptr, false);
  if (parsed.is_discarded()) {
    return core::Result<json, std::string>::err("Invalid JSON");
  }
  return core::Result<json, std::string>::ok(std::move(parsed));
}

namespace {

core::Result<json, std::string> find_record_array(const std::string_view text,
                                                  std::initializer_list<const char*> keys,
                                                  const std::string& what) {
  using ArrayResult = core::Result<json, std::string>;

  auto parsed = parse_json_text(text);
  if (!parsed.has_value()) {
    return ArrayResult::err(what + ": " + parsed.error());
  }
  const json& doc = parsed.value();
  if (doc.is_array()) {
    return ArrayResult::ok(doc);
  }
  for (const char* key : keys) {
    if (const json* value = find_field(doc, key); value != nullptr && value->is_array()) {
      return ArrayResult::ok(*value);
    }
  }
  return ArrayResult::err(what + ": expected a JSON array of records");
}

}  // namespace

core::Result<std::vector<domain::WardrobeItem>, std::string> parse_wardrobe(
    const std::string_view text) {
  using WardrobeResult = core::Result<std::vector<domain::WardrobeItem>, std::string>;

  const auto records = find_record_array(text, {"items", "wardrobe"}, "Wardrobe");
  if (!records.has_value()) {
    return WardrobeResult::err(records.error());
  }

  std::vector<domain::WardrobeItem> items;
  for (const auto& record : records.value()) {
    if (record.is_object()) {
      items.push_back(wardrobe_item_from_json(record));
    }
  }
  return WardrobeResult::ok(std::move(items));
}

core::Result<std::vector<domain::OutfitDraft>, std::string> parse_drafts(
    const std::string_view text) {
  using DraftsResult = core::Result<std::vector<domain::OutfitDraft>, std::string>;

  const auto records = find_record_array(text, {"outfits", "drafts", "candidates"}, "Drafts");
  if (!records.has_value()) {
    return DraftsResult::err(records.error());
  }

  std::vector<domain::OutfitDraft> drafts;
  for (const auto& record : records.value()) {
    if (record.is_object()) {
      drafts.push_back(outfit_draft_from_json(record));
    }
  }
  return DraftsResult::ok(std::move(drafts));
}

core::Result<scoring::PreferenceSet, std::string> parse_preferences(const std::string_view text) {
  using PreferencesResult = core::Result<scoring::PreferenceSet, std::string>;

  auto parsed = parse_json_text(text);
  if (!parsed.has_value()) {
    return PreferencesResult::err("Preferences: " + parsed.error());
  }
  if (!parsed.value().is_object()) {
    return PreferencesResult::err("Preferences: expected a JSON object");
  }
  return PreferencesResult::ok(preference_set_from_json(parsed.value()));
}

core::Result<app::PipelineConfig, std::string> parse_pipeline_config(
    const std::string_view text, const app::PipelineConfig& base) {
  auto parsed = parse_json_text(text);
  if (!parsed.has_value()) {
    return core::Result<app::PipelineConfig, std::string>::err("Config: " + parsed.error());
  }
  return pipeline_config_from_json(parsed.value(), base);
}

}  // namespace stylegate::io
