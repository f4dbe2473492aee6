#include "stylegate/taxonomy/item_classifier.h"

#include "stylegate/core/normalization.h"

#include <algorithm>
#include <map>
#include <utility>

namespace stylegate::taxonomy {

using domain::AestheticTag;
using domain::Category;
using domain::Formality;
using domain::Season;
using domain::Silhouette;

namespace {

bool any_keyword_in(const std::string& text, const std::vector<std::string_view>& keywords) {
  return std::any_of(keywords.begin(), keywords.end(), [&](const std::string_view kw) {
    return text.find(kw) != std::string::npos;
  });
}

bool vocabulary_entry_in(const std::string& text, const std::string_view entry) {
  if (text.find(entry) != std::string::npos) {
    return true;
  }
  std::string spaced(entry);
  std::replace(spaced.begin(), spaced.end(), '-', ' ');
  return text.find(spaced) != std::string::npos;
}

bool is_one_of(const std::string_view value, const std::vector<std::string_view>& options) {
  return std::find(options.begin(), options.end(), value) != options.end();
}

}  // namespace

bool CategoryRule::matches(const CategoryEvidence& evidence) const {
  switch (field) {
    case TextField::kItemType:
      return any_keyword_in(evidence.item_type, keywords);
    case TextField::kCategory:
      return any_keyword_in(evidence.category, keywords);
    case TextField::kItemTypeOrCategory:
      return any_keyword_in(evidence.item_type, keywords) ||
             any_keyword_in(evidence.category, keywords);
  }
  return false;
}

const std::vector<CategoryRule>& category_rules() {
  static const std::vector<CategoryRule> kRules = {
      {"ethnic_item_type", TextField::kItemType, {"kurta", "saree", "lehenga"}, Category::kEthnic},
      {"dress", TextField::kItemTypeOrCategory, {"dress"}, Category::kDresses},
      {"tops", TextField::kCategory,
       {"top", "shirt", "blouse", "tee", "polo", "hoodie", "sweater", "tank"}, Category::kTops},
      {"bottoms", TextField::kCategory,
       {"bottom", "pant", "jean", "short", "skirt", "trouser", "legging", "chino", "cargo",
        "jogger"},
       Category::kBottoms},
      {"footwear", TextField::kCategory,
       {"shoe", "sneaker", "boot", "sandal", "heel", "footwear", "loafer", "flip-flop", "flip flop",
        "slide"},
       Category::kFootwear},
      {"outerwear", TextField::kCategory,
       {"jacket", "coat", "blazer", "outer", "cardigan", "puffer", "windbreaker"},
       Category::kOuterwear},
      {"accessories", TextField::kCategory,
       {"accessor", "bag", "belt", "watch", "jewelry", "jewellery", "scarf", "hat", "sunglasses"},
       Category::kAccessories},
      {"sportswear", TextField::kCategory, {"sport", "gym", "athletic", "activewear"},
       Category::kSportswear},
      {"ethnic", TextField::kCategory,
       {"ethnic", "traditional", "kurta", "saree", "lehenga", "sherwani"}, Category::kEthnic},
      {"formalwear", TextField::kCategory, {"formal", "suit"}, Category::kFormalwear},
  };
  return kRules;
}

CategoryEvidence make_evidence(const domain::WardrobeItem& item) {
  return CategoryEvidence{core::normalize_ascii_lower(item.category),
                          core::normalize_ascii_lower(item.item_type)};
}

Category classify_category(const CategoryEvidence& evidence, std::string* rule_id) {
  for (const auto& rule : category_rules()) {
    if (rule.matches(evidence)) {
      if (rule_id != nullptr) {
        *rule_id = std::string(rule.rule_id);
      }
      return rule.category;
    }
  }
  if (rule_id != nullptr) {
    *rule_id = "default";
  }
  return Category::kTops;
}

const std::vector<std::string_view>& subcategory_vocabulary(const Category category) {
  static const std::map<Category, std::vector<std::string_view>> kVocabulary = {
      {Category::kTops,
       {"t-shirt", "shirt", "blouse", "sweater", "hoodie", "tank", "polo", "crop-top"}},
      {Category::kBottoms,
       {"jeans", "trousers", "shorts", "skirt", "leggings", "cargo", "chinos", "palazzos"}},
      {Category::kFootwear,
       {"sneakers", "loafers", "heels", "boots", "sandals", "flats", "slides", "flip-flops",
        "formal-shoes"}},
      {Category::kOuterwear,
       {"jacket", "blazer", "coat", "cardigan", "puffer", "windbreaker", "shrug"}},
      {Category::kAccessories, {"bag", "belt", "watch", "jewelry", "scarf", "hat", "sunglasses"}},
      {Category::kEthnic, {"kurta", "saree", "lehenga", "sherwani", "salwar", "dupatta", "dhoti"}},
      {Category::kSportswear, {"track-pants", "sports-bra", "gym-shorts", "athletic-top"}},
      {Category::kFormalwear, {"suit", "formal-shirt", "formal-trousers", "tuxedo"}},
      {Category::kDresses, {"casual-dress", "formal-dress", "maxi", "midi", "mini", "gown"}},
  };
  return kVocabulary.at(category);
}

std::string_view default_subcategory(const Category category) {
  switch (category) {
    case Category::kTops:
      return "t-shirt";
    case Category::kBottoms:
      return "jeans";
    case Category::kFootwear:
      return "sneakers";
    case Category::kOuterwear:
      return "jacket";
    case Category::kAccessories:
      return "bag";
    case Category::kEthnic:
      return "kurta";
    case Category::kSportswear:
      return "track-pants";
    case Category::kFormalwear:
      return "formal-shirt";
    case Category::kDresses:
      return "casual-dress";
  }
  return "t-shirt";
}

std::string infer_subcategory(const std::string_view name, const std::string_view item_type,
                              const Category category) {
  const std::string search_text =
      core::normalize_ascii_lower(std::string(name) + " " + std::string(item_type));

  for (const auto entry : subcategory_vocabulary(category)) {
    if (vocabulary_entry_in(search_text, entry)) {
      return std::string(entry);
    }
  }
  return std::string(default_subcategory(category));
}

Silhouette infer_silhouette(const std::string_view fit, const std::string_view subcategory) {
  const std::string lower = core::normalize_ascii_lower(fit);

  if (any_keyword_in(lower, {"slim", "fitted", "tight", "skinny"})) {
    return Silhouette::kSlim;
  }
  if (any_keyword_in(lower, {"relaxed", "loose"})) {
    return Silhouette::kRelaxed;
  }
  if (any_keyword_in(lower, {"oversized", "baggy"})) {
    return Silhouette::kOversized;
  }
  if (any_keyword_in(lower, {"longline", "long"})) {
    return Silhouette::kLongline;
  }
  if (!lower.empty()) {
    return Silhouette::kRegular;
  }

  // Cut implied by the garment type.
  if (is_one_of(subcategory, {"kurta", "sherwani"})) {
    return Silhouette::kLongline;
  }
  if (is_one_of(subcategory, {"cargo", "palazzos"})) {
    return Silhouette::kRelaxed;
  }
  return Silhouette::kRegular;
}

Formality infer_formality(const std::string_view formality, const Category category,
                          const std::string_view subcategory) {
  const std::string lower = core::normalize_ascii_lower(formality);

  // "informal" and "semi-formal" contain "formal", so they are tested first.
  if (lower.find("informal") != std::string::npos) {
    return Formality::kCasual;
  }
  if (any_keyword_in(lower, {"smart-casual", "smart casual", "business casual"})) {
    return Formality::kSmartCasual;
  }
  if (any_keyword_in(lower, {"semi-formal", "semi formal"})) {
    return Formality::kSmart;
  }
  if (lower.find("formal") != std::string::npos) {
    return Formality::kFormal;
  }
  if (lower.find("smart") != std::string::npos) {
    return Formality::kSmart;
  }
  if (lower.find("casual") != std::string::npos) {
    return Formality::kCasual;
  }

  if (category == Category::kFormalwear) {
    return Formality::kFormal;
  }
  if (is_one_of(subcategory, {"blazer", "formal-shoes"})) {
    return Formality::kSmart;
  }
  return Formality::kCasual;
}

Season infer_season(const std::vector<std::string>& seasons, const std::string_view subcategory) {
  const std::string joined = core::normalize_ascii_lower(core::join_non_empty(seasons));

  if (any_keyword_in(joined, {"winter", "cold"})) {
    return Season::kCold;
  }
  if (any_keyword_in(joined, {"summer", "hot"})) {
    return Season::kHot;
  }
  if (any_keyword_in(joined, {"spring", "fall", "autumn", "mild"})) {
    return Season::kMild;
  }
  if (!joined.empty()) {
    return Season::kAllSeason;
  }

  if (is_one_of(subcategory, {"puffer", "coat"})) {
    return Season::kCold;
  }
  return Season::kAllSeason;
}

std::vector<AestheticTag> infer_aesthetics(const std::vector<std::string>& style_aesthetic) {
  std::vector<AestheticTag> tags;
  for (const auto& raw : style_aesthetic) {
    const auto tag = domain::parse_aesthetic_tag(core::trim(raw));
    if (tag && std::find(tags.begin(), tags.end(), *tag) == tags.end()) {
      tags.push_back(*tag);
    }
  }
  return tags;
}

domain::ClassifiedItem classify_item(const domain::WardrobeItem& item) {
  const Category category = classify_category(make_evidence(item));
  std::string subcategory = infer_subcategory(item.name, item.item_type, category);

  domain::ClassifiedItem out;
  out.id = item.id;
  out.name = core::trim(item.name);
  if (out.name.empty()) {
    out.name = core::join_non_empty({core::trim(item.color), core::trim(item.category)});
  }
  out.category = category;
  out.silhouette = infer_silhouette(item.fit, subcategory);
  out.formality = infer_formality(item.formality, category, subcategory);
  out.season = infer_season(item.seasons, subcategory);
  out.aesthetic_tags = infer_aesthetics(item.style_aesthetic);
  out.subcategory = std::move(subcategory);

  const std::string color = core::trim(!item.color.empty() ? item.color : item.primary_color);
  out.color_family = color.empty() ? "unknown" : core::normalize_ascii_lower(color);

  out.source.raw_name = core::trim(item.name);
  out.source.raw_category = item.category;
  out.source.item_type = item.item_type;
  out.source.fabric = item.fabric;
  out.source.fit = item.fit;
  out.source.style_aesthetic = item.style_aesthetic;
  out.source.image_url =
      !item.processed_image_url.empty() ? item.processed_image_url : item.image_url;
  out.has_image = !out.source.image_url.empty();
  return out;
}

std::vector<domain::ClassifiedItem> classify_wardrobe(
    const std::vector<domain::WardrobeItem>& items) {
  std::vector<domain::ClassifiedItem> out;
  out.reserve(items.size());
  for (const auto& item : items) {
    out.push_back(classify_item(item));
  }
  return out;
}

}  // namespace stylegate::taxonomy
