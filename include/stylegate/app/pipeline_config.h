#pragma once

#include "stylegate/grounding/image_resolver.h"
#include "stylegate/ranking/candidate_ranker.h"
#include "stylegate/rules/rule_context.h"

namespace stylegate::app {

// PipelineConfig bundles every tunable of a styling run. Soft-scoring constants live
// in ranker.scoring.
struct PipelineConfig {
  rules::RuleConfig rules;
  ranking::RankerConfig ranker;
  grounding::GroundingConfig grounding;

  bool operator==(const PipelineConfig&) const = default;
};

}  // namespace stylegate::app
