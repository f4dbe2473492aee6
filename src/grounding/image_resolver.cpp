#include "stylegate/grounding/image_resolver.h"

#include "stylegate/core/normalization.h"

#include <algorithm>
#include <utility>

namespace stylegate::grounding {

using domain::Category;
using domain::Layer;
using domain::Layout;

namespace {

struct LayerKeywords {
  Layer layer;
  std::vector<std::string_view> words;
};

// Checked in order; the first layer with a matching word wins.
const std::vector<LayerKeywords>& layer_keywords() {
  static const std::vector<LayerKeywords> kTable = {
      {Layer::kOuter,
       {"jacket", "coat", "blazer", "cardigan", "outerwear", "puffer", "windbreaker", "shrug"}},
      {Layer::kOnePiece, {"jumpsuit", "romper"}},
      {Layer::kDress, {"dress", "dresses", "gown"}},
      {Layer::kTop,
       {"top", "tops", "shirt", "blouse", "tee", "sweater", "hoodie", "tank", "polo", "crop",
        "kurta", "sherwani"}},
      {Layer::kBottom,
       {"bottom", "bottoms", "pants", "jeans", "trousers", "shorts", "skirt", "leggings",
        "chinos", "cargo", "joggers", "palazzos"}},
      {Layer::kShoes,
       {"shoe", "shoes", "sneakers", "heels", "boots", "sandals", "flats", "loafers", "slides"}},
      {Layer::kAccessory,
       {"accessory", "accessories", "bag", "handbag", "purse", "jewelry", "watch", "belt",
        "scarf", "hat", "sunglasses"}},
  };
  return kTable;
}

Layer layer_for_category(const Category category) {
  switch (category) {
    case Category::kOuterwear:
      return Layer::kOuter;
    case Category::kDresses:
      return Layer::kDress;
    case Category::kTops:
    case Category::kEthnic:
    case Category::kSportswear:
    case Category::kFormalwear:
      return Layer::kTop;
    case Category::kBottoms:
      return Layer::kBottom;
    case Category::kFootwear:
      return Layer::kShoes;
    case Category::kAccessories:
      return Layer::kAccessory;
  }
  return Layer::kAccessory;
}

bool contains_field(const std::string& hint_lower, const std::string_view field) {
  const std::string value = core::normalize_ascii_lower(core::trim(field));
  return !value.empty() && hint_lower.find(value) != std::string::npos;
}

const domain::ClassifiedItem* find_by_id(const std::vector<domain::ClassifiedItem>& items,
                                         const std::string& id) {
  const auto it = std::find_if(items.begin(), items.end(),
                               [&](const domain::ClassifiedItem& i) { return i.id == id; });
  return it == items.end() ? nullptr : &*it;
}

}  // namespace

int similarity_score(const std::string_view hint, const domain::ClassifiedItem& item,
                     const GroundingConfig& config) {
  const std::string hint_lower = core::normalize_ascii_lower(hint);
  int score = 0;

  // Only a supplied name counts; the classifier's "<color> <category>" fallback would
  // score the colour and category twice.
  const std::string name = core::normalize_ascii_lower(item.source.raw_name);
  if (!name.empty() && hint_lower.find(name) != std::string::npos) {
    score += config.name_match;
  } else {
    for (const auto& word : core::split_whitespace(name)) {
      if (word.size() >= config.min_name_word_length &&
          hint_lower.find(word) != std::string::npos) {
        score += config.name_word_match;
      }
    }
  }

  if (item.color_family != "unknown" && contains_field(hint_lower, item.color_family)) {
    score += config.color_match;
  }
  if (contains_field(hint_lower, item.source.raw_category)) {
    score += config.category_match;
  }
  if (contains_field(hint_lower, item.source.item_type)) {
    score += config.item_type_match;
  }
  if (contains_field(hint_lower, item.source.fabric)) {
    score += config.fabric_match;
  }
  if (contains_field(hint_lower, item.source.fit)) {
    score += config.fit_match;
  }
  for (const auto& style : item.source.style_aesthetic) {
    if (contains_field(hint_lower, style)) {
      score += config.aesthetic_match;
    }
  }

  return score;
}

std::optional<std::size_t> find_best_match(const std::string_view hint,
                                           const std::vector<domain::ClassifiedItem>& items,
                                           const UsedItemIds& used,
                                           const GroundingConfig& config) {
  std::optional<std::size_t> best;
  int best_score = 0;

  for (std::size_t i = 0; i < items.size(); ++i) {
    const auto& item = items[i];
    if (!item.has_image || used.count(item.id) > 0) {
      continue;
    }
    const int score = similarity_score(hint, item, config);
    if (score > best_score) {
      best_score = score;
      best = i;
    }
  }

  if (best_score < config.min_accept_score) {
    return std::nullopt;
  }
  return best;
}

Layer determine_layer(const domain::ClassifiedItem& item) {
  std::vector<std::string> words;
  for (const std::string_view text :
       {std::string_view(item.subcategory), std::string_view(item.source.item_type),
        std::string_view(item.name)}) {
    auto tokens = core::tokenize_ascii(text);
    words.insert(words.end(), tokens.begin(), tokens.end());
  }

  for (const auto& entry : layer_keywords()) {
    const bool hit =
        std::any_of(entry.words.begin(), entry.words.end(), [&](const std::string_view kw) {
          return std::find(words.begin(), words.end(), kw) != words.end();
        });
    if (hit) {
      return entry.layer;
    }
  }
  return layer_for_category(item.category);
}

Layout layout_for(const std::size_t item_count) noexcept {
  switch (item_count) {
    case 0:
    case 1:
      return Layout::k1x1;
    case 2:
      return Layout::k2x1;
    case 3:
      return Layout::k3x1;
    default:
      return Layout::k2x2;
  }
}

OutfitGrounding ground_outfit(const domain::OutfitDraft& draft,
                              const std::vector<domain::ClassifiedItem>& items,
                              UsedItemIds used, const GroundingConfig& config) {
  std::vector<domain::VisualOutfitItem> resolved;

  for (const auto& [slot, slot_item] : draft.slots.items_in_order()) {
    const domain::ClassifiedItem* match = nullptr;

    if (slot_item->item_id && !slot_item->item_id->empty()) {
      const auto* by_id = find_by_id(items, *slot_item->item_id);
      if (by_id != nullptr && by_id->has_image && used.count(by_id->id) == 0) {
        match = by_id;
      }
    }
    if (match == nullptr && !core::trim(slot_item->hint).empty()) {
      if (const auto index = find_best_match(slot_item->hint, items, used, config)) {
        match = &items[*index];
      }
    }
    if (match == nullptr) {
      continue;
    }

    used.insert(match->id);
    resolved.push_back(domain::VisualOutfitItem{match->id, match->name,
                                                match->source.image_url,
                                                determine_layer(*match)});
  }

  std::stable_sort(resolved.begin(), resolved.end(),
                   [](const domain::VisualOutfitItem& a, const domain::VisualOutfitItem& b) {
                     return domain::layer_priority(a.layer) < domain::layer_priority(b.layer);
                   });
  if (resolved.size() > config.max_display_items) {
    resolved.resize(config.max_display_items);
  }

  OutfitGrounding grounding{};
  if (resolved.empty()) {
    grounding.used = std::move(used);
    return grounding;
  }

  domain::VisualOutfit outfit{};
  outfit.draft_id = draft.id;
  outfit.title = draft.title;
  outfit.layout = layout_for(resolved.size());
  outfit.items = std::move(resolved);
  outfit.why_it_works = draft.why_it_works;
  outfit.occasion = draft.occasion;
  outfit.vibe = draft.vibe;

  grounding.outfit = std::move(outfit);
  grounding.used = std::move(used);
  return grounding;
}

BatchGrounding resolve_outfits(const std::vector<domain::OutfitDraft>& drafts,
                               const std::vector<domain::ClassifiedItem>& items,
                               const GroundingConfig& config) {
  BatchGrounding batch{};
  for (const auto& draft : drafts) {
    auto grounding = ground_outfit(draft, items, UsedItemIds{}, config);
    if (grounding.outfit) {
      batch.outfits.push_back(std::move(*grounding.outfit));
    } else {
      ++batch.dropped_count;
    }
  }
  return batch;
}

}  // namespace stylegate::grounding
