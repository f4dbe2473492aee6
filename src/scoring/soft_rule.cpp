#include "stylegate/scoring/soft_rule.h"

#include "stylegate/core/normalization.h"

#include <string>
#include <utility>

namespace stylegate::scoring {

namespace {

struct SourceList {
  const std::vector<std::string>* statements;
  const char* id_prefix;
  double weight;
  const char* explanation;
};

bool has_negation(const std::string_view text) {
  return core::contains_any_ci(text, {"avoid", "don't", "not"});
}

}  // namespace

std::string_view to_string(const SoftRuleType type) noexcept {
  switch (type) {
    case SoftRuleType::kPrefer:
      return "prefer";
    case SoftRuleType::kAvoid:
      return "avoid";
  }
  return "prefer";
}

bool PreferenceSet::empty() const noexcept {
  return valid_pairs.empty() && avoid_pairs.empty() && core_directions.empty() &&
         color_rules.empty() && silhouette_rules.empty() && body_type_rules.empty() &&
         gender_style_notes.empty();
}

std::vector<SoftRule> normalize_preferences(const PreferenceSet& preferences) {
  const SourceList sources[] = {
      {&preferences.valid_pairs, "soft_valid_", 0.6, "Suggested pairing that works well"},
      {&preferences.avoid_pairs, "soft_avoid_", 0.7, "Suggested pairing to avoid"},
      {&preferences.core_directions, "soft_direction_", 0.5, "Overall styling direction"},
      {&preferences.color_rules, "soft_color_", 0.55, "Colour guidance"},
      {&preferences.silhouette_rules, "soft_silhouette_", 0.45, "Silhouette guidance"},
      {&preferences.body_type_rules, "soft_body_", 0.5, "Body type guidance"},
      {&preferences.gender_style_notes, "soft_gender_", 0.4, "Gender-aware styling"},
  };

  std::vector<SoftRule> rules;
  int next_id = 0;
  for (const auto& source : sources) {
    for (const auto& statement : *source.statements) {
      SoftRule rule;
      rule.id = source.id_prefix + std::to_string(next_id++);
      rule.condition = statement;
      rule.weight = source.weight;
      rule.explanation = source.explanation;
      if (source.statements == &preferences.avoid_pairs) {
        rule.type = SoftRuleType::kAvoid;
      } else if (source.statements == &preferences.color_rules && has_negation(statement)) {
        rule.type = SoftRuleType::kAvoid;
      }
      rules.push_back(std::move(rule));
    }
  }
  return rules;
}

std::vector<SoftRule> default_soft_rules() {
  return {
      {"default_color_neutral", SoftRuleType::kPrefer,
       "neutral colors like black, white, grey, navy work with most items", 0.4,
       "Safe colour choice"},
      {"default_balance_silhouette", SoftRuleType::kPrefer,
       "balance fitted items with relaxed items for proportion", 0.3, "Proportion guidance"},
      {"default_avoid_clash", SoftRuleType::kAvoid,
       "clashing bright colors like red and orange together", 0.5, "Colour clash"},
      {"default_complete_look", SoftRuleType::kPrefer, "complete looks with cohesive aesthetic",
       0.4, "Outfit cohesion"},
  };
}

std::vector<SoftRule> soft_rules_for(const std::optional<PreferenceSet>& preferences) {
  if (!preferences) {
    return default_soft_rules();
  }
  return normalize_preferences(*preferences);
}

}  // namespace stylegate::scoring
