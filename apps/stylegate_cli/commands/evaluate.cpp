#include "evaluate.h"

#include "input_files.h"
#include "stylegate/app/app_service.h"
#include "stylegate/core/clock.h"
#include "stylegate/core/id_generator.h"
#include "stylegate/core/normalization.h"
#include "stylegate/domain/taxonomy.h"
#include "stylegate/io/json_codec.h"
#include "stylegate/rules/rule_context.h"
#include "stylegate/storage/audit_log.h"
#include "stylegate/storage/sqlite/sqlite_audit_log.h"
#include "stylegate/storage/sqlite/sqlite_db.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <charconv>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace {

struct EvaluateCliConfig {
  std::optional<std::string> wardrobe_path;
  std::optional<std::string> drafts_path;
  std::optional<std::string> preferences_path;
  std::optional<std::string> config_path;
  std::optional<std::string> db_path;
  bool show_audit{false};

  // Overrides applied on top of --config
  std::optional<stylegate::domain::Season> climate;
  std::optional<stylegate::domain::Formality> formality;
  std::optional<stylegate::domain::ResponseMode> mode;
  std::optional<stylegate::rules::Strictness> strictness;
  std::optional<std::size_t> top_n;
  std::vector<stylegate::domain::AestheticTag> aesthetics;
};

template <typename T>
bool assign_parsed(std::optional<T>& target, std::optional<T> value, const std::string& flag,
                   const std::string& raw, const char* valid) {
  if (!value.has_value()) {
    std::cerr << "Invalid " << flag << ": " << raw << " (valid: " << valid << ")\n";
    return false;
  }
  target = value;
  return true;
}

bool parse_top_n(EvaluateCliConfig& c, const std::string& v) {
  std::size_t n = 0;
  const auto [end, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
  if (ec != std::errc{} || end != v.data() + v.size() || n == 0) {
    std::cerr << "Invalid --top-n: " << v << " (expected a positive integer)\n";
    return false;
  }
  c.top_n = n;
  return true;
}

bool parse_aesthetics(EvaluateCliConfig& c, const std::string& v) {
  bool ok = true;
  for (const auto& raw : stylegate::core::split_on(v, ',')) {
    const std::string name = stylegate::core::trim(raw);
    if (name.empty()) {
      continue;
    }
    const auto tag = stylegate::domain::parse_aesthetic_tag(name);
    if (!tag.has_value()) {
      std::cerr << "Unknown aesthetic: " << name << "\n";
      ok = false;
      continue;
    }
    c.aesthetics.push_back(*tag);
  }
  return ok;
}

void print_audit_trail(const std::string& trace_id, const stylegate::storage::IAuditLog& log) {
  std::cerr << "--- Audit Trail (trace_id=" << trace_id << ") ---\n";
  for (const auto& event : stylegate::app::fetch_audit_trace(trace_id, log)) {
    std::cerr << event.created_at << " [" << event.event_type << "] " << event.payload << "\n";
  }
}

}  // namespace

int cmd_evaluate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using stylegate::domain::parse_formality;
  using stylegate::domain::parse_response_mode;
  using stylegate::domain::parse_season;

  const std::vector<stylegate::apps::Option<EvaluateCliConfig>> options = {
      {"--wardrobe", true, "<file>", "Wardrobe JSON (array of records)",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.wardrobe_path = v;
         return true;
       }},
      {"--drafts", true, "<file>", "Candidate outfit drafts JSON",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.drafts_path = v;
         return true;
       }},
      {"--preferences", true, "<file>", "Styling preference statements JSON",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.preferences_path = v;
         return true;
       }},
      {"--config", true, "<file>", "Pipeline configuration JSON",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--climate", true, "<season>", "Current climate (hot|mild|cold)",
       [](EvaluateCliConfig& c, const std::string& v) {
         return assign_parsed(c.climate, parse_season(v), "--climate", v, "hot, mild, cold");
       }},
      {"--formality", true, "<level>", "Occasion formality (casual|smart-casual|smart|formal)",
       [](EvaluateCliConfig& c, const std::string& v) {
         return assign_parsed(c.formality, parse_formality(v), "--formality", v,
                              "casual, smart-casual, smart, formal");
       }},
      {"--mode", true, "<mode>", "Response mode",
       [](EvaluateCliConfig& c, const std::string& v) {
         return assign_parsed(c.mode, parse_response_mode(v), "--mode", v,
                              "visual_outfit, advisory_text, shopping_comparison, mixed");
       }},
      {"--strictness", true, "<level>", "Hard rule strictness (relaxed|normal|strict)",
       [](EvaluateCliConfig& c, const std::string& v) {
         return assign_parsed(c.strictness, stylegate::rules::parse_strictness(v),
                              "--strictness", v, "relaxed, normal, strict");
       }},
      {"--top-n", true, "<n>", "Number of outfits to ground", parse_top_n},
      {"--aesthetics", true, "<a,b>", "Target aesthetics, comma separated", parse_aesthetics},
      {"--db", true, "<file>", "Persist the audit trail to this SQLite database",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--show-audit", false, "", "Print the audit trail on stderr",
       [](EvaluateCliConfig& c, const std::string&) {
         c.show_audit = true;
         return true;
       }},
  };
  const auto parsed = stylegate::apps::parse_options(argc, argv, options, 2);
  const auto& cli = parsed.config;
  if (!parsed.ok || !cli.wardrobe_path.has_value() || !cli.drafts_path.has_value()) {
    stylegate::apps::print_usage(std::cerr, "evaluate", options);
    return 1;
  }

  stylegate::app::StylingRequest request;

  if (cli.config_path.has_value()) {
    const auto text = read_text_file(*cli.config_path);
    if (!text.has_value()) {
      std::cerr << "Error: " << text.error() << "\n";
      return 1;
    }
    const auto config = stylegate::io::parse_pipeline_config(text.value());
    if (!config.has_value()) {
      std::cerr << "Error: " << *cli.config_path << ": " << config.error() << "\n";
      return 1;
    }
    request.config = config.value();
  }
  if (cli.strictness.has_value()) {
    request.config.rules.strictness = *cli.strictness;
  }
  if (cli.top_n.has_value()) {
    // An explicit top-n also moves the relaxation threshold unless the config pinned it.
    request.config.ranker.top_n = *cli.top_n;
  }

  const auto wardrobe = load_wardrobe_file(*cli.wardrobe_path);
  if (!wardrobe.has_value()) {
    std::cerr << "Error: " << wardrobe.error() << "\n";
    return 1;
  }
  request.wardrobe = wardrobe.value();

  const auto drafts = load_drafts_file(*cli.drafts_path);
  if (!drafts.has_value()) {
    std::cerr << "Error: " << drafts.error() << "\n";
    return 1;
  }
  request.drafts = drafts.value();

  if (cli.preferences_path.has_value()) {
    const auto preferences = load_preferences_file(*cli.preferences_path);
    if (!preferences.has_value()) {
      std::cerr << "Error: " << preferences.error() << "\n";
      return 1;
    }
    request.preferences = preferences.value();
  }

  if (cli.mode.has_value()) {
    request.context.response_mode = *cli.mode;
  }
  request.context.climate = cli.climate;
  request.context.formality = cli.formality;
  request.target_aesthetics = cli.aesthetics;

  stylegate::core::SystemIdGenerator id_gen;
  stylegate::core::SystemClock clock;

  if (cli.db_path.has_value()) {
    auto db_result = stylegate::storage::sqlite::SqliteDb::open(*cli.db_path);
    if (!db_result.has_value()) {
      std::cerr << "Failed to open database: " << db_result.error() << "\n";
      return 1;
    }
    auto db = db_result.value();
    const auto schema_result = db->ensure_audit_schema();
    if (!schema_result.has_value()) {
      std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
      return 1;
    }

    stylegate::storage::sqlite::SqliteAuditLog audit_log(db);
    const auto response = stylegate::app::run_styling_pipeline(request, audit_log, id_gen, clock);
    std::cout << stylegate::io::styling_response_to_json(response).dump(2) << "\n";
    if (cli.show_audit) {
      print_audit_trail(response.trace_id, audit_log);
    }
    if (const auto error = audit_log.last_error()) {
      std::cerr << "Failed to persist audit trail: " << *error << "\n";
      return 1;
    }
    return 0;
  }

  stylegate::storage::InMemoryAuditLog audit_log;
  const auto response = stylegate::app::run_styling_pipeline(request, audit_log, id_gen, clock);
  std::cout << stylegate::io::styling_response_to_json(response).dump(2) << "\n";
  if (cli.show_audit) {
    print_audit_trail(response.trace_id, audit_log);
  }
  return 0;
}
