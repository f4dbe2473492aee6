#pragma once

// Builders shared by the test executables. Each returns a fresh value.

#include "stylegate/domain/outfit_draft.h"
#include "stylegate/domain/wardrobe_item.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stylegate::testing {

inline domain::SlotItem slot(std::string hint, std::string category = "",
                             std::string subcategory = "") {
  domain::SlotItem item;
  item.hint = std::move(hint);
  item.category = std::move(category);
  item.subcategory = std::move(subcategory);
  return item;
}

// A complete casual outfit: white t-shirt, blue jeans, white sneakers.
inline domain::OutfitDraft casual_outfit(std::string id = "draft-1") {
  domain::OutfitDraft draft;
  draft.id = std::move(id);
  draft.title = "Easy weekend";
  draft.slots.upper_wear = slot("white t-shirt", "tops", "t-shirt");
  draft.slots.lower_wear = slot("blue jeans", "bottoms", "jeans");
  draft.slots.footwear = slot("white sneakers", "footwear", "sneakers");
  draft.why_it_works = "Clean basics that always pair.";
  return draft;
}

inline domain::WardrobeItem wardrobe_item(std::string id, std::string name, std::string category,
                                          std::string item_type, std::string color,
                                          std::string image_url = "") {
  domain::WardrobeItem item;
  item.id = std::move(id);
  item.name = std::move(name);
  item.category = std::move(category);
  item.item_type = std::move(item_type);
  item.color = std::move(color);
  item.image_url = std::move(image_url);
  return item;
}

// The three-piece wardrobe that grounds casual_outfit() completely.
inline std::vector<domain::WardrobeItem> basics_wardrobe() {
  return {
      wardrobe_item("1", "White T-Shirt", "Tops", "T-Shirt", "White", "https://img/1.png"),
      wardrobe_item("2", "Blue Jeans", "Bottoms", "Jeans", "Blue", "https://img/2.png"),
      wardrobe_item("3", "White Sneakers", "Footwear", "Sneakers", "White", "https://img/3.png"),
  };
}

}  // namespace stylegate::testing
