#pragma once

#include "stylegate/core/normalization.h"
#include "stylegate/domain/outfit_draft.h"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace stylegate::rules::detail {

// Lowercased, trimmed subcategory with spaces folded to hyphens ("flip flops" -> "flip-flops").
inline std::string normalized_subcategory(const domain::SlotItem& item) {
  std::string out = core::normalize_ascii_lower(core::trim(item.subcategory));
  std::replace(out.begin(), out.end(), ' ', '-');
  return out;
}

inline std::string normalized_category(const domain::SlotItem& item) {
  return core::normalize_ascii_lower(core::trim(item.category));
}

inline bool is_any_of(const std::string& value, const std::vector<std::string_view>& options) {
  return std::find(options.begin(), options.end(), value) != options.end();
}

}  // namespace stylegate::rules::detail
