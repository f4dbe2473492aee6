#include "stylegate/coverage/coverage_profiler.h"

#include <algorithm>

namespace stylegate::coverage {

using domain::Category;
using domain::OutfitSlot;

std::string_view to_string(const CoverageLevel level) noexcept {
  switch (level) {
    case CoverageLevel::kNone:
      return "none";
    case CoverageLevel::kLow:
      return "low";
    case CoverageLevel::kMedium:
      return "medium";
    case CoverageLevel::kHigh:
      return "high";
  }
  return "none";
}

const CategoryCoverage& CoverageProfile::at(const Category category) const {
  static const CategoryCoverage kEmpty{};
  const auto it = by_category.find(category);
  return it == by_category.end() ? kEmpty : it->second;
}

namespace {

double confidence_score(const CoverageProfile& profile) {
  double score = 0.0;
  if (profile.total_items >= 10) {
    score += 0.3;
  } else if (profile.total_items >= 5) {
    score += 0.2;
  } else if (profile.total_items > 0) {
    score += 0.1;
  }

  const auto mandatory_filled =
      static_cast<int>(domain::kMandatorySlots.size() - profile.missing_mandatory_slots.size());
  score += 0.2 * mandatory_filled;

  if (profile.at(Category::kOuterwear).count > 0) {
    score += 0.05;
  }
  if (profile.at(Category::kAccessories).count > 0) {
    score += 0.05;
  }
  return std::min(score, 1.0);
}

}  // namespace

CoverageProfile build_coverage_profile(const std::vector<domain::ClassifiedItem>& items) {
  CoverageProfile profile;
  for (const Category category : domain::kAllCategories) {
    profile.by_category[category] = CategoryCoverage{};
  }

  for (const auto& item : items) {
    auto& entry = profile.by_category[item.category];
    ++entry.count;
    ++profile.total_items;
    if (item.has_image) {
      ++entry.with_images;
      ++profile.total_with_images;
    }
  }
  for (auto& [category, entry] : profile.by_category) {
    entry.level = coverage_level(entry.count);
  }

  const auto count = [&](const Category c) { return profile.at(c).count; };
  const auto images = [&](const Category c) { return profile.at(c).with_images; };

  const bool has_upper = count(Category::kTops) > 0 || count(Category::kDresses) > 0;
  const bool has_lower = count(Category::kBottoms) > 0 || count(Category::kDresses) > 0;
  const bool has_footwear = count(Category::kFootwear) > 0;

  if (has_upper) {
    profile.available_slots.push_back(OutfitSlot::kUpperWear);
  }
  if (has_lower) {
    profile.available_slots.push_back(OutfitSlot::kLowerWear);
  }
  if (has_footwear) {
    profile.available_slots.push_back(OutfitSlot::kFootwear);
  }
  if (count(Category::kOuterwear) > 0) {
    profile.available_slots.push_back(OutfitSlot::kLayering);
  }
  if (count(Category::kAccessories) > 0) {
    profile.available_slots.push_back(OutfitSlot::kAccessories);
  }

  // Dresses fill upper and lower, never footwear.
  if (!has_upper) {
    profile.missing_mandatory_slots.push_back(OutfitSlot::kUpperWear);
  }
  if (!has_lower) {
    profile.missing_mandatory_slots.push_back(OutfitSlot::kLowerWear);
  }
  if (!has_footwear) {
    profile.missing_mandatory_slots.push_back(OutfitSlot::kFootwear);
  }
  profile.can_create_complete_outfit = profile.missing_mandatory_slots.empty();

  profile.can_support_visual_outfits =
      profile.can_create_complete_outfit &&
      (images(Category::kTops) > 0 || images(Category::kDresses) > 0) &&
      (images(Category::kBottoms) > 0 || images(Category::kDresses) > 0) &&
      images(Category::kFootwear) > 0;

  profile.wardrobe_confidence_score = confidence_score(profile);
  return profile;
}

std::optional<std::string> describe_gaps(const CoverageProfile& profile) {
  if (profile.missing_mandatory_slots.empty()) {
    return std::nullopt;
  }

  std::vector<std::string> names;
  for (const OutfitSlot slot : profile.missing_mandatory_slots) {
    switch (slot) {
      case OutfitSlot::kUpperWear:
        names.emplace_back("tops");
        break;
      case OutfitSlot::kLowerWear:
        names.emplace_back("bottoms");
        break;
      case OutfitSlot::kFootwear:
        names.emplace_back("footwear");
        break;
      case OutfitSlot::kLayering:
      case OutfitSlot::kAccessories:
        break;
    }
  }

  std::string joined;
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i > 0) {
      joined += (i + 1 == names.size()) ? " and " : ", ";
    }
    joined += names[i];
  }
  return "Your wardrobe has no " + joined +
         ", so complete outfits cannot be built from it yet.";
}

}  // namespace stylegate::coverage
