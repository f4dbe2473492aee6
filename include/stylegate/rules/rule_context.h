#pragma once

#include "stylegate/domain/taxonomy.h"

#include <optional>
#include <set>
#include <string>

namespace stylegate::rules {

// RuleContext carries request-level facts shared by every draft in a batch.
struct RuleContext {
  domain::ResponseMode response_mode{domain::ResponseMode::kVisualOutfit};
  bool has_wardrobe_items{false};
  std::optional<domain::Season> climate;
  std::optional<domain::Formality> formality;

  bool operator==(const RuleContext&) const = default;
};

enum class Strictness {
  kRelaxed,
  kNormal,
  kStrict,
};

[[nodiscard]] std::string_view to_string(Strictness strictness) noexcept;
[[nodiscard]] std::optional<Strictness> parse_strictness(std::string_view text);

// RuleConfig toggles the optional rule families. Mandatory slots, duplicate items and
// wardrobe availability always run.
struct RuleConfig {
  bool check_formality{true};
  bool check_silhouette{true};
  bool check_ethnic_coherence{true};
  bool check_climate{true};
  Strictness strictness{Strictness::kNormal};

  bool operator==(const RuleConfig&) const = default;
};

// RelaxationPolicy names the rules whose block severity is demoted to warn during the
// ranker's relaxed pass. Structural rules can never be demoted.
struct RelaxationPolicy {
  std::set<std::string> demotable_rule_ids;

  [[nodiscard]] static RelaxationPolicy defaults();
  [[nodiscard]] static RelaxationPolicy none() { return RelaxationPolicy{}; }

  [[nodiscard]] bool demotes(const std::string& rule_id) const;

  bool operator==(const RelaxationPolicy&) const = default;
};

[[nodiscard]] bool is_demotable_rule(const std::string& rule_id);

}  // namespace stylegate::rules
