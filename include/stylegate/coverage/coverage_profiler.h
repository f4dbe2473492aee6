#pragma once

#include "stylegate/domain/classified_item.h"
#include "stylegate/domain/taxonomy.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stylegate::coverage {

enum class CoverageLevel {
  kNone,
  kLow,
  kMedium,
  kHigh,
};

[[nodiscard]] std::string_view to_string(CoverageLevel level) noexcept;

// coverage_level maps a count to its level: none (0), low (<3), medium (<5), high (>=5).
[[nodiscard]] constexpr CoverageLevel coverage_level(const int count) noexcept {
  if (count < 1) {
    return CoverageLevel::kNone;
  }
  if (count < 3) {
    return CoverageLevel::kLow;
  }
  if (count < 5) {
    return CoverageLevel::kMedium;
  }
  return CoverageLevel::kHigh;
}

struct CategoryCoverage {
  int count{0};
  int with_images{0};
  CoverageLevel level{CoverageLevel::kNone};

  bool operator==(const CategoryCoverage&) const = default;
};

// CoverageProfile summarises which outfit slots a wardrobe can fill.
// Every canonical category is present in by_category, including empty ones.
struct CoverageProfile {
  std::map<domain::Category, CategoryCoverage> by_category;
  int total_items{0};
  int total_with_images{0};
  std::vector<domain::OutfitSlot> available_slots;
  std::vector<domain::OutfitSlot> missing_mandatory_slots;
  bool can_create_complete_outfit{false};
  bool can_support_visual_outfits{false};
  double wardrobe_confidence_score{0.0};

  [[nodiscard]] const CategoryCoverage& at(domain::Category category) const;

  bool operator==(const CoverageProfile&) const = default;
};

[[nodiscard]] CoverageProfile build_coverage_profile(
    const std::vector<domain::ClassifiedItem>& items);

// describe_gaps returns a user-facing sentence naming the missing mandatory slots,
// or nullopt when the wardrobe can build a complete outfit.
[[nodiscard]] std::optional<std::string> describe_gaps(const CoverageProfile& profile);

}  // namespace stylegate::coverage
