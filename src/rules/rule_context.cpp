#include "stylegate/rules/rule_context.h"

#include "stylegate/core/normalization.h"
#include "stylegate/rules/rule_ids.h"
#include "stylegate/rules/violation.h"

namespace stylegate::rules {

std::string_view to_string(const Severity severity) noexcept {
  switch (severity) {
    case Severity::kWarn:
      return "warn";
    case Severity::kBlock:
      return "block";
  }
  return "warn";
}

std::string_view to_string(const Strictness strictness) noexcept {
  switch (strictness) {
    case Strictness::kRelaxed:
      return "relaxed";
    case Strictness::kNormal:
      return "normal";
    case Strictness::kStrict:
      return "strict";
  }
  return "normal";
}

std::optional<Strictness> parse_strictness(const std::string_view text) {
  const std::string lower = core::normalize_ascii_lower(core::trim(text));
  if (lower == "relaxed") {
    return Strictness::kRelaxed;
  }
  if (lower == "normal") {
    return Strictness::kNormal;
  }
  if (lower == "strict") {
    return Strictness::kStrict;
  }
  return std::nullopt;
}

bool is_demotable_rule(const std::string& rule_id) {
  return rule_id != rule_ids::kMandatorySlots && rule_id != rule_ids::kDuplicateItems;
}

RelaxationPolicy RelaxationPolicy::defaults() {
  return RelaxationPolicy{{rule_ids::kSilhouette, rule_ids::kFormalityOccasion}};
}

bool RelaxationPolicy::demotes(const std::string& rule_id) const {
  return is_demotable_rule(rule_id) && demotable_rule_ids.count(rule_id) > 0;
}

}  // namespace stylegate::rules
