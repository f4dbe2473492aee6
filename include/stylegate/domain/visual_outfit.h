#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stylegate::domain {

// Display layer of a grounded item. Priority drives ordering in the rendered grid.
enum class Layer {
  kOuter,
  kTop,
  kDress,
  kOnePiece,
  kBottom,
  kShoes,
  kAccessory,
};

[[nodiscard]] constexpr int layer_priority(const Layer layer) noexcept {
  switch (layer) {
    case Layer::kOuter:
      return 1;
    case Layer::kTop:
    case Layer::kDress:
    case Layer::kOnePiece:
      return 2;
    case Layer::kBottom:
      return 3;
    case Layer::kShoes:
      return 4;
    case Layer::kAccessory:
      return 5;
  }
  return 5;
}

enum class Layout {
  k1x1,
  k2x1,
  k3x1,
  k2x2,
};

[[nodiscard]] std::string_view to_string(Layer value) noexcept;
[[nodiscard]] std::string_view to_string(Layout value) noexcept;

struct VisualOutfitItem {
  std::string id;
  std::string name;
  std::string image_url;
  Layer layer{Layer::kAccessory};

  bool operator==(const VisualOutfitItem&) const = default;
};

// VisualOutfit is the renderable result. Always holds at least one item; outfits that
// ground to nothing are never constructed.
struct VisualOutfit {
  std::string draft_id;
  std::string title;
  Layout layout{Layout::k1x1};
  std::vector<VisualOutfitItem> items;
  std::string why_it_works;
  std::optional<std::string> occasion;
  std::optional<std::string> vibe;

  bool operator==(const VisualOutfit&) const = default;
};

}  // namespace stylegate::domain
