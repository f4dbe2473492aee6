#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace stylegate::domain {

// Canonical clothing taxonomy. Wire names are lowercase and hyphenated
// ("smart-casual", "all-season") and round-trip through to_string/parse_*.

enum class Category {
  kTops,
  kBottoms,
  kFootwear,
  kOuterwear,
  kAccessories,
  kEthnic,
  kSportswear,
  kFormalwear,
  kDresses,
};

inline constexpr std::array<Category, 9> kAllCategories = {
    Category::kTops,      Category::kBottoms,    Category::kFootwear,
    Category::kOuterwear, Category::kAccessories, Category::kEthnic,
    Category::kSportswear, Category::kFormalwear, Category::kDresses,
};

enum class Silhouette {
  kSlim,
  kRegular,
  kRelaxed,
  kLongline,
  kOversized,
};

// Formality is ordinal: casual < smart-casual < smart < formal.
enum class Formality {
  kCasual = 0,
  kSmartCasual = 1,
  kSmart = 2,
  kFormal = 3,
};

enum class Season {
  kHot,
  kMild,
  kCold,
  kAllSeason,
};

enum class AestheticTag {
  kStreetwear,
  kMinimal,
  kPreppy,
  kEthnic,
  kBohemian,
  kSporty,
  kElegant,
  kEdgy,
  kClassic,
  kTrendy,
};

inline constexpr std::array<AestheticTag, 10> kAllAestheticTags = {
    AestheticTag::kStreetwear, AestheticTag::kMinimal, AestheticTag::kPreppy,
    AestheticTag::kEthnic,     AestheticTag::kBohemian, AestheticTag::kSporty,
    AestheticTag::kElegant,    AestheticTag::kEdgy,     AestheticTag::kClassic,
    AestheticTag::kTrendy,
};

enum class OutfitSlot {
  kUpperWear,
  kLowerWear,
  kFootwear,
  kLayering,
  kAccessories,
};

inline constexpr std::array<OutfitSlot, 3> kMandatorySlots = {
    OutfitSlot::kUpperWear, OutfitSlot::kLowerWear, OutfitSlot::kFootwear};

// How the caller intends to present results; only visual_outfit triggers the
// wardrobe-availability rule.
enum class ResponseMode {
  kVisualOutfit,
  kAdvisoryText,
  kShoppingComparison,
  kMixed,
};

[[nodiscard]] std::string_view to_string(Category value) noexcept;
[[nodiscard]] std::string_view to_string(Silhouette value) noexcept;
[[nodiscard]] std::string_view to_string(Formality value) noexcept;
[[nodiscard]] std::string_view to_string(Season value) noexcept;
[[nodiscard]] std::string_view to_string(AestheticTag value) noexcept;
[[nodiscard]] std::string_view to_string(OutfitSlot value) noexcept;
[[nodiscard]] std::string_view to_string(ResponseMode value) noexcept;

// parse_* accept the wire name in any ASCII case and return nullopt otherwise.
[[nodiscard]] std::optional<Category> parse_category(std::string_view text);
[[nodiscard]] std::optional<Silhouette> parse_silhouette(std::string_view text);
[[nodiscard]] std::optional<Formality> parse_formality(std::string_view text);
[[nodiscard]] std::optional<Season> parse_season(std::string_view text);
[[nodiscard]] std::optional<AestheticTag> parse_aesthetic_tag(std::string_view text);
[[nodiscard]] std::optional<OutfitSlot> parse_outfit_slot(std::string_view text);
[[nodiscard]] std::optional<ResponseMode> parse_response_mode(std::string_view text);

// formality_distance is the number of steps between two levels on the ordinal chain.
[[nodiscard]] constexpr int formality_distance(Formality a, Formality b) noexcept {
  const int d = static_cast<int>(a) - static_cast<int>(b);
  return d < 0 ? -d : d;
}

}  // namespace stylegate::domain
