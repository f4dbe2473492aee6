#pragma once

#include "stylegate/domain/classified_item.h"
#include "stylegate/domain/taxonomy.h"
#include "stylegate/domain/wardrobe_item.h"

#include <string>
#include <string_view>
#include <vector>

namespace stylegate::taxonomy {

// Which raw text a category rule inspects.
enum class TextField {
  kItemType,
  kCategory,
  kItemTypeOrCategory,
};

// CategoryEvidence is the lowercased text a category rule reads.
struct CategoryEvidence {
  std::string category;
  std::string item_type;
};

// CategoryRule is one (predicate, canonical category) pair of the classification
// cascade. The predicate is "any keyword occurs in the selected field".
struct CategoryRule {
  std::string_view rule_id;
  TextField field{TextField::kCategory};
  std::vector<std::string_view> keywords;
  domain::Category category{domain::Category::kTops};

  [[nodiscard]] bool matches(const CategoryEvidence& evidence) const;
};

// category_rules returns the cascade in priority order:
//   1. ethnic item types (kurta, saree, lehenga)
//   2. "dress" in item type or category
//   3. category keyword buckets: tops, bottoms, footwear, outerwear, accessories,
//      sportswear, ethnic, formalwear
// The first matching rule wins; when none matches the category is tops.
[[nodiscard]] const std::vector<CategoryRule>& category_rules();

[[nodiscard]] CategoryEvidence make_evidence(const domain::WardrobeItem& item);

// classify_category runs the cascade. Returns the matched rule id through rule_id when
// non-null ("default" when nothing matched).
[[nodiscard]] domain::Category classify_category(const CategoryEvidence& evidence,
                                                 std::string* rule_id = nullptr);

// Subcategory vocabulary for a category, in match priority order.
[[nodiscard]] const std::vector<std::string_view>& subcategory_vocabulary(domain::Category category);
[[nodiscard]] std::string_view default_subcategory(domain::Category category);

// infer_subcategory matches "<name> <item_type>" against the category vocabulary.
// Hyphenated entries also match their spaced form ("flip-flops" ~ "flip flops").
[[nodiscard]] std::string infer_subcategory(std::string_view name, std::string_view item_type,
                                            domain::Category category);

[[nodiscard]] domain::Silhouette infer_silhouette(std::string_view fit,
                                                  std::string_view subcategory);
[[nodiscard]] domain::Formality infer_formality(std::string_view formality,
                                                domain::Category category,
                                                std::string_view subcategory);
[[nodiscard]] domain::Season infer_season(const std::vector<std::string>& seasons,
                                          std::string_view subcategory);
[[nodiscard]] std::vector<domain::AestheticTag> infer_aesthetics(
    const std::vector<std::string>& style_aesthetic);

// classify_item is pure and total: every record yields exactly one ClassifiedItem.
[[nodiscard]] domain::ClassifiedItem classify_item(const domain::WardrobeItem& item);

[[nodiscard]] std::vector<domain::ClassifiedItem> classify_wardrobe(
    const std::vector<domain::WardrobeItem>& items);

}  // namespace stylegate::taxonomy
