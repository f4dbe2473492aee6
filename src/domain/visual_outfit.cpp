#include "stylegate/domain/visual_outfit.h"

namespace stylegate::domain {

std::string_view to_string(const Layer value) noexcept {
  switch (value) {
    case Layer::kOuter:
      return "outer";
    case Layer::kTop:
      return "top";
    case Layer::kDress:
      return "dress";
    case Layer::kOnePiece:
      return "one-piece";
    case Layer::kBottom:
      return "bottom";
    case Layer::kShoes:
      return "shoes";
    case Layer::kAccessory:
      return "accessory";
  }
  return "accessory";
}

std::string_view to_string(const Layout value) noexcept {
  switch (value) {
    case Layout::k1x1:
      return "1x1";
    case Layout::k2x1:
      return "2x1";
    case Layout::k3x1:
      return "3x1";
    case Layout::k2x2:
      return "2x2";
  }
  return "1x1";
}

}  // namespace stylegate::domain
