#include "stylegate/domain/taxonomy.h"

#include "stylegate/core/normalization.h"

#include <string>

namespace stylegate::domain {

namespace {

// Linear lookup over a closed enum domain; the domains are small.
template <typename Enum, std::size_t N>
std::optional<Enum> parse_from(const std::array<Enum, N>& values, const std::string_view text) {
  const std::string needle = core::normalize_ascii_lower(core::trim(text));
  for (const Enum value : values) {
    if (to_string(value) == needle) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace

std::string_view to_string(const Category value) noexcept {
  switch (value) {
    case Category::kTops:
      return "tops";
    case Category::kBottoms:
      return "bottoms";
    case Category::kFootwear:
      return "footwear";
    case Category::kOuterwear:
      return "outerwear";
    case Category::kAccessories:
      return "accessories";
    case Category::kEthnic:
      return "ethnic";
    case Category::kSportswear:
      return "sportswear";
    case Category::kFormalwear:
      return "formalwear";
    case Category::kDresses:
      return "dresses";
  }
  return "tops";
}

std::string_view to_string(const Silhouette value) noexcept {
  switch (value) {
    case Silhouette::kSlim:
      return "slim";
    case Silhouette::kRegular:
      return "regular";
    case Silhouette::kRelaxed:
      return "relaxed";
    case Silhouette::kLongline:
      return "longline";
    case Silhouette::kOversized:
      return "oversized";
  }
  return "regular";
}

std::string_view to_string(const Formality value) noexcept {
  switch (value) {
    case Formality::kCasual:
      return "casual";
    case Formality::kSmartCasual:
      return "smart-casual";
    case Formality::kSmart:
      return "smart";
    case Formality::kFormal:
      return "formal";
  }
  return "casual";
}

std::string_view to_string(const Season value) noexcept {
  switch (value) {
    case Season::kHot:
      return "hot";
    case Season::kMild:
      return "mild";
    case Season::kCold:
      return "cold";
    case Season::kAllSeason:
      return "all-season";
  }
  return "all-season";
}

std::string_view to_string(const AestheticTag value) noexcept {
  switch (value) {
    case AestheticTag::kStreetwear:
      return "streetwear";
    case AestheticTag::kMinimal:
      return "minimal";
    case AestheticTag::kPreppy:
      return "preppy";
    case AestheticTag::kEthnic:
      return "ethnic";
    case AestheticTag::kBohemian:
      return "bohemian";
    case AestheticTag::kSporty:
      return "sporty";
    case AestheticTag::kElegant:
      return "elegant";
    case AestheticTag::kEdgy:
      return "edgy";
    case AestheticTag::kClassic:
      return "classic";
    case AestheticTag::kTrendy:
      return "trendy";
  }
  return "minimal";
}

std::string_view to_string(const OutfitSlot value) noexcept {
  switch (value) {
    case OutfitSlot::kUpperWear:
      return "upper_wear";
    case OutfitSlot::kLowerWear:
      return "lower_wear";
    case OutfitSlot::kFootwear:
      return "footwear";
    case OutfitSlot::kLayering:
      return "layering";
    case OutfitSlot::kAccessories:
      return "accessories";
  }
  return "upper_wear";
}

std::string_view to_string(const ResponseMode value) noexcept {
  switch (value) {
    case ResponseMode::kVisualOutfit:
      return "visual_outfit";
    case ResponseMode::kAdvisoryText:
      return "advisory_text";
    case ResponseMode::kShoppingComparison:
      return "shopping_comparison";
    case ResponseMode::kMixed:
      return "mixed";
  }
  return "visual_outfit";
}

std::optional<Category> parse_category(const std::string_view text) {
  return parse_from(kAllCategories, text);
}

std::optional<Silhouette> parse_silhouette(const std::string_view text) {
  constexpr std::array<Silhouette, 5> kValues = {Silhouette::kSlim, Silhouette::kRegular,
                                                 Silhouette::kRelaxed, Silhouette::kLongline,
                                                 Silhouette::kOversized};
  return parse_from(kValues, text);
}

std::optional<Formality> parse_formality(const std::string_view text) {
  constexpr std::array<Formality, 4> kValues = {Formality::kCasual, Formality::kSmartCasual,
                                                Formality::kSmart, Formality::kFormal};
  return parse_from(kValues, text);
}

std::optional<Season> parse_season(const std::string_view text) {
  constexpr std::array<Season, 4> kValues = {Season::kHot, Season::kMild, Season::kCold,
                                             Season::kAllSeason};
  return parse_from(kValues, text);
}

std::optional<AestheticTag> parse_aesthetic_tag(const std::string_view text) {
  return parse_from(kAllAestheticTags, text);
}

std::optional<OutfitSlot> parse_outfit_slot(const std::string_view text) {
  constexpr std::array<OutfitSlot, 5> kValues = {OutfitSlot::kUpperWear, OutfitSlot::kLowerWear,
                                                 OutfitSlot::kFootwear, OutfitSlot::kLayering,
                                                 OutfitSlot::kAccessories};
  return parse_from(kValues, text);
}

std::optional<ResponseMode> parse_response_mode(const std::string_view text) {
  constexpr std::array<ResponseMode, 4> kValues = {
      ResponseMode::kVisualOutfit, ResponseMode::kAdvisoryText,
      ResponseMode::kShoppingComparison, ResponseMode::kMixed};
  return parse_from(kValues, text);
}

}  // namespace stylegate::domain
