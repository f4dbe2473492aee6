#pragma once

namespace stylegate::rules::rule_ids {

inline constexpr const char* kMandatorySlots = "mandatory_slots";
inline constexpr const char* kFormalityFootwear = "formality_mismatch_footwear";
inline constexpr const char* kFormalityOccasion = "formality_occasion_mismatch";
inline constexpr const char* kFormalityGeneral = "formality_general_mismatch";
inline constexpr const char* kSilhouette = "silhouette_mismatch";
inline constexpr const char* kEthnicCoherence = "ethnic_coherence";
inline constexpr const char* kClimateHeavyLayering = "climate_heavy_layering";
inline constexpr const char* kClimateTooLight = "climate_too_light";
inline constexpr const char* kDuplicateItems = "duplicate_items";
inline constexpr const char* kWardrobeUpperMissing = "wardrobe_upper_missing";
inline constexpr const char* kWardrobeLowerMissing = "wardrobe_lower_missing";
inline constexpr const char* kWardrobeFootwearMissing = "wardrobe_footwear_missing";

}  // namespace stylegate::rules::rule_ids
