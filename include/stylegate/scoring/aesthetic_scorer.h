#pragma once

#include "stylegate/domain/taxonomy.h"
#include "stylegate/scoring/scoring_config.h"

#include <string_view>
#include <vector>

namespace stylegate::scoring {

// Garment and styling words associated with each aesthetic.
[[nodiscard]] const std::vector<std::string_view>& aesthetic_keywords(domain::AestheticTag tag);

// score_aesthetic_alignment: each target scores 1.0 when its name occurs in the text,
// 0.5 when one of its keywords does, 0 otherwise. Result is the mean over targets,
// capped at 1; neutral_score when there are no targets.
[[nodiscard]] double score_aesthetic_alignment(std::string_view outfit_text,
                                               const std::vector<domain::AestheticTag>& targets,
                                               const ScoringConfig& config = ScoringConfig{});

}  // namespace stylegate::scoring
