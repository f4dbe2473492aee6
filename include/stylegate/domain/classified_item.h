#pragma once

#include "stylegate/domain/taxonomy.h"

#include <string>
#include <vector>

namespace stylegate::domain {

// SourceAttributes keeps the raw provider text that grounding scores hints against.
struct SourceAttributes {
  std::string raw_name;  // Empty when the record had no name
  std::string raw_category;
  std::string item_type;
  std::string fabric;
  std::string fit;
  std::vector<std::string> style_aesthetic;  // As supplied, not filtered to AestheticTag
  std::string image_url;                     // processed_image_url preferred

  bool operator==(const SourceAttributes&) const = default;
};

// ClassifiedItem is the canonical view of a wardrobe record.
// Derived per request, never persisted.
struct ClassifiedItem {
  std::string id;
  std::string name;
  Category category{Category::kTops};
  std::string subcategory;
  Silhouette silhouette{Silhouette::kRegular};
  Formality formality{Formality::kCasual};
  Season season{Season::kAllSeason};
  std::vector<AestheticTag> aesthetic_tags;
  std::string color_family;
  bool has_image{false};
  SourceAttributes source;

  bool operator==(const ClassifiedItem&) const = default;
};

}  // namespace stylegate::domain
