#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stylegate::scoring {

enum class SoftRuleType {
  kPrefer,
  kAvoid,
};

[[nodiscard]] std::string_view to_string(SoftRuleType type) noexcept;

// SoftRule is a weighted preference. It influences ranking and never blocks.
struct SoftRule {
  std::string id;
  SoftRuleType type{SoftRuleType::kPrefer};
  std::string condition;
  double weight{0.0};
  std::string explanation;

  bool operator==(const SoftRule&) const = default;
};

// PreferenceSet is the free-text preference payload from the external preference source.
struct PreferenceSet {
  std::vector<std::string> valid_pairs;
  std::vector<std::string> avoid_pairs;
  std::vector<std::string> core_directions;
  std::vector<std::string> color_rules;
  std::vector<std::string> silhouette_rules;
  std::vector<std::string> body_type_rules;
  std::vector<std::string> gender_style_notes;

  [[nodiscard]] bool empty() const noexcept;

  bool operator==(const PreferenceSet&) const = default;
};

// normalize_preferences converts each statement into a SoftRule with the fixed weight of
// its source list. Ids share one counter across lists ("soft_valid_0", "soft_avoid_1", ...).
// Colour statements with negation ("avoid", "don't", "not") become avoid rules.
[[nodiscard]] std::vector<SoftRule> normalize_preferences(const PreferenceSet& preferences);

// default_soft_rules is used when no preference source is available.
[[nodiscard]] std::vector<SoftRule> default_soft_rules();

// soft_rules_for returns normalize_preferences(*preferences) or the defaults.
[[nodiscard]] std::vector<SoftRule> soft_rules_for(const std::optional<PreferenceSet>& preferences);

}  // namespace stylegate::scoring
