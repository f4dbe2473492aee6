#pragma once

#include "stylegate/domain/classified_item.h"
#include "stylegate/domain/outfit_draft.h"
#include "stylegate/domain/visual_outfit.h"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace stylegate::grounding {

// Similarity weights for matching a free-text hint to a wardrobe item.
struct GroundingConfig {
  int name_match{50};      // Hint contains the full item name
  int name_word_match{15}; // Per item-name word found in the hint (partial match)
  int color_match{25};
  int category_match{20};
  int item_type_match{20};
  int fabric_match{10};
  int fit_match{10};
  int aesthetic_match{8};  // Per style tag found in the hint
  std::size_t min_name_word_length{3};
  int min_accept_score{15};
  std::size_t max_display_items{4};

  bool operator==(const GroundingConfig&) const = default;
};

// Item ids already placed in the outfit being resolved.
using UsedItemIds = std::set<std::string>;

[[nodiscard]] int similarity_score(std::string_view hint, const domain::ClassifiedItem& item,
                                   const GroundingConfig& config = GroundingConfig{});

// find_best_match returns the index of the highest-scoring unused item with an image,
// or nullopt when no score reaches min_accept_score. Earlier items win ties.
[[nodiscard]] std::optional<std::size_t> find_best_match(
    std::string_view hint, const std::vector<domain::ClassifiedItem>& items,
    const UsedItemIds& used, const GroundingConfig& config = GroundingConfig{});

// determine_layer matches whole words of subcategory, item type and name against the
// layer keyword table, falling back to the canonical category.
[[nodiscard]] domain::Layer determine_layer(const domain::ClassifiedItem& item);

[[nodiscard]] domain::Layout layout_for(std::size_t item_count) noexcept;

// OutfitGrounding is the result of resolving one draft. used is the exclusion set after
// resolution, returned so the caller owns its lifetime.
struct OutfitGrounding {
  std::optional<domain::VisualOutfit> outfit;  // nullopt when nothing resolved
  UsedItemIds used;
};

// ground_outfit resolves each slot in slot order against items not yet in used.
// An explicit item_id wins when that item is unused and has an image; otherwise the
// hint is matched by similarity.
[[nodiscard]] OutfitGrounding ground_outfit(const domain::OutfitDraft& draft,
                                            const std::vector<domain::ClassifiedItem>& items,
                                            UsedItemIds used,
                                            const GroundingConfig& config = GroundingConfig{});

struct BatchGrounding {
  std::vector<domain::VisualOutfit> outfits;
  std::size_t dropped_count{0};
};

// resolve_outfits grounds each draft with its own empty exclusion set and drops drafts
// that resolve to nothing.
[[nodiscard]] BatchGrounding resolve_outfits(const std::vector<domain::OutfitDraft>& drafts,
                                             const std::vector<domain::ClassifiedItem>& items,
                                             const GroundingConfig& config = GroundingConfig{});

}  // namespace stylegate::grounding
