#include "stylegate/scoring/aesthetic_scorer.h"

#include "stylegate/core/normalization.h"

#include <algorithm>
#include <map>
#include <string>

namespace stylegate::scoring {

using domain::AestheticTag;

const std::vector<std::string_view>& aesthetic_keywords(const AestheticTag tag) {
  static const std::map<AestheticTag, std::vector<std::string_view>> kKeywords = {
      {AestheticTag::kStreetwear,
       {"hoodie", "sneaker", "cargo", "oversized", "graphic", "jogger"}},
      {AestheticTag::kMinimal,
       {"clean", "simple", "neutral", "basic", "understated", "monochrome"}},
      {AestheticTag::kPreppy, {"polo", "chino", "loafer", "oxford", "button-down", "blazer"}},
      {AestheticTag::kEthnic, {"kurta", "saree", "lehenga", "traditional", "embroidered"}},
      {AestheticTag::kBohemian, {"flowy", "print", "maxi", "fringe", "earthy", "layered"}},
      {AestheticTag::kSporty, {"athletic", "track", "sneaker", "jersey", "performance"}},
      {AestheticTag::kElegant, {"silk", "satin", "heel", "refined", "sophisticated", "tailored"}},
      {AestheticTag::kEdgy, {"leather", "black", "chain", "distressed", "bold", "statement"}},
      {AestheticTag::kClassic, {"timeless", "tailored", "neutral", "structured", "polished"}},
      {AestheticTag::kTrendy, {"current", "fashion-forward", "statement", "bold"}},
  };
  return kKeywords.at(tag);
}

double score_aesthetic_alignment(const std::string_view outfit_text,
                                 const std::vector<AestheticTag>& targets,
                                 const ScoringConfig& config) {
  if (targets.empty()) {
    return config.neutral_score;
  }

  const std::string text = core::normalize_ascii_lower(outfit_text);
  double matches = 0.0;
  for (const auto tag : targets) {
    if (text.find(domain::to_string(tag)) != std::string::npos) {
      matches += 1.0;
      continue;
    }
    const auto& keywords = aesthetic_keywords(tag);
    if (std::any_of(keywords.begin(), keywords.end(), [&](const std::string_view kw) {
          return text.find(kw) != std::string::npos;
        })) {
      matches += 0.5;
    }
  }
  return std::min(1.0, matches / static_cast<double>(targets.size()));
}

}  // namespace stylegate::scoring
