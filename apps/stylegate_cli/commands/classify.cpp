#include "classify.h"

#include "input_files.h"
#include "stylegate/io/json_codec.h"
#include "stylegate/taxonomy/item_classifier.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ClassifyCliConfig {
  std::optional<std::string> wardrobe_path;
  bool explain{false};
};

}  // namespace

int cmd_classify(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<stylegate::apps::Option<ClassifyCliConfig>> options = {
      {"--wardrobe", true, "<file>", "Wardrobe JSON (array of records)",
       [](ClassifyCliConfig& c, const std::string& v) {
         c.wardrobe_path = v;
         return true;
       }},
      {"--explain", false, "", "Include the category rule that fired for each record",
       [](ClassifyCliConfig& c, const std::string&) {
         c.explain = true;
         return true;
       }},
  };
  const auto parsed = stylegate::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || !parsed.config.wardrobe_path.has_value()) {
    stylegate::apps::print_usage(std::cerr, "classify", options);
    return 1;
  }

  const auto wardrobe = load_wardrobe_file(*parsed.config.wardrobe_path);
  if (!wardrobe.has_value()) {
    std::cerr << "Error: " << wardrobe.error() << "\n";
    return 1;
  }

  nlohmann::json out = nlohmann::json::array();
  for (const auto& record : wardrobe.value()) {
    nlohmann::json entry =
        stylegate::io::classified_item_to_json(stylegate::taxonomy::classify_item(record));
    if (parsed.config.explain) {
      std::string rule_id;
      (void)stylegate::taxonomy::classify_category(stylegate::taxonomy::make_evidence(record),
                                                   &rule_id);
      entry["category_rule"] = rule_id;
    }
    out.push_back(std::move(entry));
  }

  std::cout << out.dump(2) << "\n";
  return 0;
}
