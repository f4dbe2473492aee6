#pragma once

#include <string>
#include <vector>

namespace stylegate::domain {

// WardrobeItem is one raw record as supplied by the wardrobe provider.
// Every field except id may be empty; the classifier is total over this struct.
// Immutable for the duration of a request.
struct WardrobeItem {
  std::string id;
  std::string name;
  std::string category;
  std::string item_type;
  std::string color;
  std::string primary_color;
  std::string fabric;
  std::string fit;
  std::string formality;
  std::vector<std::string> seasons;
  std::vector<std::string> style_aesthetic;
  std::string image_url;
  std::string processed_image_url;

  bool operator==(const WardrobeItem&) const = default;
};

}  // namespace stylegate::domain
