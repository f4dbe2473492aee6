#pragma once

#include "stylegate/domain/taxonomy.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stylegate::domain {

// SlotItem is the generator's abstract description of one garment.
// category and subcategory are free text; the typed attributes are absent when the
// generator did not supply a recognised value.
struct SlotItem {
  std::string hint;
  std::optional<std::string> item_id;
  std::string category;
  std::string subcategory;
  std::optional<Formality> formality;
  std::optional<Silhouette> silhouette;
  std::optional<Season> season;
  std::vector<std::string> aesthetic_tags;
  std::string color_family;

  bool operator==(const SlotItem&) const = default;
};

// OutfitSlots maps each OutfitSlot to its item(s). accessories is the only list slot.
struct OutfitSlots {
  std::optional<SlotItem> upper_wear;
  std::optional<SlotItem> lower_wear;
  std::optional<SlotItem> footwear;
  std::optional<SlotItem> layering;
  std::vector<SlotItem> accessories;

  // Returns the single-item slot, or nullptr when absent. For kAccessories returns the
  // first accessory (nullptr when the list is empty).
  [[nodiscard]] const SlotItem* get(OutfitSlot slot) const noexcept;

  // Every present item paired with its slot, in slot order (upper, lower, footwear,
  // layering, accessories in list order).
  [[nodiscard]] std::vector<std::pair<OutfitSlot, const SlotItem*>> items_in_order() const;

  bool operator==(const OutfitSlots&) const = default;
};

// OutfitDraft is one candidate outfit from the external generator. Consumed once.
struct OutfitDraft {
  std::string id;
  std::string title;
  OutfitSlots slots;
  std::string why_it_works;
  std::optional<std::string> occasion;
  std::optional<std::string> vibe;
  std::string source{"generator"};

  bool operator==(const OutfitDraft&) const = default;
};

// is_dress_or_one_piece: upper_wear is a dress (category "dresses", or hint mentions
// "dress" or "jumpsuit"). Such drafts only require footwear.
[[nodiscard]] bool is_dress_or_one_piece(const OutfitDraft& draft);

// missing_slots lists absent mandatory slots, honouring the dress exception.
[[nodiscard]] std::vector<OutfitSlot> missing_slots(const OutfitDraft& draft);

[[nodiscard]] inline bool is_outfit_complete(const OutfitDraft& draft) {
  return missing_slots(draft).empty();
}

// describe_outfit builds the lowercase text the soft scorer and aesthetic scorer read:
// slot hints, colour families, the upper silhouette, vibe and occasion.
[[nodiscard]] std::string describe_outfit(const OutfitDraft& draft);

}  // namespace stylegate::domain
