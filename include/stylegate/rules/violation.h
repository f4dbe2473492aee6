#pragma once

#include "stylegate/domain/taxonomy.h"

#include <string>
#include <string_view>
#include <vector>

namespace stylegate::rules {

// Severity is closed: adding a level must update every switch over it.
enum class Severity {
  kWarn,
  kBlock,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

// RuleViolation is produced once by a rule and never mutated afterwards.
// penalty is the score cost when the violation is (or is demoted to) a warning.
struct RuleViolation {
  std::string rule_id;
  Severity severity{Severity::kWarn};
  std::string message;
  std::vector<domain::OutfitSlot> slots_involved;
  std::vector<std::string> evidence;
  double penalty{0.0};
  bool demoted{false};  // Block demoted to warn by a relaxation policy

  bool operator==(const RuleViolation&) const = default;
};

}  // namespace stylegate::rules
