#include "coverage.h"

#include "input_files.h"
#include "stylegate/coverage/coverage_profiler.h"
#include "stylegate/io/json_codec.h"
#include "stylegate/taxonomy/item_classifier.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct CoverageCliConfig {
  std::optional<std::string> wardrobe_path;
};

}  // namespace

int cmd_coverage(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<stylegate::apps::Option<CoverageCliConfig>> options = {
      {"--wardrobe", true, "<file>", "Wardrobe JSON (array of records)",
       [](CoverageCliConfig& c, const std::string& v) {
         c.wardrobe_path = v;
         return true;
       }},
  };
  const auto parsed = stylegate::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || !parsed.config.wardrobe_path.has_value()) {
    stylegate::apps::print_usage(std::cerr, "coverage", options);
    return 1;
  }

  const auto wardrobe = load_wardrobe_file(*parsed.config.wardrobe_path);
  if (!wardrobe.has_value()) {
    std::cerr << "Error: " << wardrobe.error() << "\n";
    return 1;
  }

  const auto profile = stylegate::coverage::build_coverage_profile(
      stylegate::taxonomy::classify_wardrobe(wardrobe.value()));
  std::cout << stylegate::io::coverage_profile_to_json(profile).dump(2) << "\n";
  return 0;
}
