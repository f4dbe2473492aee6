#pragma once

#include "stylegate/core/result.h"
#include "stylegate/domain/outfit_draft.h"
#include "stylegate/domain/wardrobe_item.h"
#include "stylegate/scoring/soft_rule.h"

#include <string>
#include <vector>

// File loaders shared by the subcommands. Error messages name the offending path.

[[nodiscard]] stylegate::core::Result<std::string, std::string> read_text_file(
    const std::string& path);

[[nodiscard]] stylegate::core::Result<std::vector<stylegate::domain::WardrobeItem>, std::string>
load_wardrobe_file(const std::string& path);

[[nodiscard]] stylegate::core::Result<std::vector<stylegate::domain::OutfitDraft>, std::string>
load_drafts_file(const std::string& path);

[[nodiscard]] stylegate::core::Result<stylegate::scoring::PreferenceSet, std::string>
load_preferences_file(const std::string& path);
