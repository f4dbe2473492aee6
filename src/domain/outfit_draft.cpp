#include "stylegate/domain/outfit_draft.h"

#include "stylegate/core/normalization.h"

namespace stylegate::domain {

const SlotItem* OutfitSlots::get(const OutfitSlot slot) const noexcept {
  switch (slot) {
    case OutfitSlot::kUpperWear:
      return upper_wear ? &*upper_wear : nullptr;
    case OutfitSlot::kLowerWear:
      return lower_wear ? &*lower_wear : nullptr;
    case OutfitSlot::kFootwear:
      return footwear ? &*footwear : nullptr;
    case OutfitSlot::kLayering:
      return layering ? &*layering : nullptr;
    case OutfitSlot::kAccessories:
      return accessories.empty() ? nullptr : &accessories.front();
  }
  return nullptr;
}

std::vector<std::pair<OutfitSlot, const SlotItem*>> OutfitSlots::items_in_order() const {
  std::vector<std::pair<OutfitSlot, const SlotItem*>> out;
  out.reserve(4 + accessories.size());

  for (const OutfitSlot slot : {OutfitSlot::kUpperWear, OutfitSlot::kLowerWear,
                                OutfitSlot::kFootwear, OutfitSlot::kLayering}) {
    if (const SlotItem* item = get(slot)) {
      out.emplace_back(slot, item);
    }
  }
  for (const auto& accessory : accessories) {
    out.emplace_back(OutfitSlot::kAccessories, &accessory);
  }
  return out;
}

bool is_dress_or_one_piece(const OutfitDraft& draft) {
  const SlotItem* upper = draft.slots.get(OutfitSlot::kUpperWear);
  if (upper == nullptr) {
    return false;
  }
  return core::normalize_ascii_lower(core::trim(upper->category)) == "dresses" ||
         core::contains_ci(upper->hint, "dress") || core::contains_ci(upper->hint, "jumpsuit");
}

std::vector<OutfitSlot> missing_slots(const OutfitDraft& draft) {
  std::vector<OutfitSlot> missing;

  if (is_dress_or_one_piece(draft)) {
    if (!draft.slots.footwear) {
      missing.push_back(OutfitSlot::kFootwear);
    }
    return missing;
  }

  for (const OutfitSlot slot : kMandatorySlots) {
    if (draft.slots.get(slot) == nullptr) {
      missing.push_back(slot);
    }
  }
  return missing;
}

std::string describe_outfit(const OutfitDraft& draft) {
  std::vector<std::string> parts;
  const auto& slots = draft.slots;

  if (slots.upper_wear) {
    parts.push_back(slots.upper_wear->hint);
    parts.push_back(slots.upper_wear->color_family);
    if (slots.upper_wear->silhouette) {
      parts.emplace_back(to_string(*slots.upper_wear->silhouette));
    }
  }
  if (slots.lower_wear) {
    parts.push_back(slots.lower_wear->hint);
    parts.push_back(slots.lower_wear->color_family);
  }
  if (slots.footwear) {
    parts.push_back(slots.footwear->hint);
  }
  if (slots.layering) {
    parts.push_back(slots.layering->hint);
  }
  for (const auto& accessory : slots.accessories) {
    parts.push_back(accessory.hint);
  }
  if (draft.vibe) {
    parts.push_back(*draft.vibe);
  }
  if (draft.occasion) {
    parts.push_back(*draft.occasion);
  }

  return core::normalize_ascii_lower(core::join_non_empty(parts));
}

}  // namespace stylegate::domain
