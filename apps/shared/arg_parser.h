#pragma once

#include <functional>
#include <iostream>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace stylegate::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined settings struct that handlers populate.
// handler returns false when the value is invalid; it reports the reason on stderr.
template <typename Config>
struct Option {
  std::string name;
  bool requires_value{false};
  std::string value_hint;  // Shown in usage, e.g. "<file>"
  std::string description;
  std::function<bool(Config&, const std::string& value)> handler;
};

template <typename Config>
struct ParsedOptions {
  Config config;
  bool ok{true};  // false after any unknown flag, missing value or rejected value
};

// parse_options dispatches argv[start..argc-1] to the registered handlers.
// Every flag is processed even after a failure so that all problems are reported at once.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const auto it = option_map.find(arg);
    if (it == option_map.end()) {
      std::cerr << (!arg.empty() && arg[0] == '-' ? "Unknown option: " : "Unexpected argument: ")
                << arg << "\n";
      parsed.ok = false;
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      parsed.ok = opt->handler(parsed.config, "") && parsed.ok;
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "Option " << arg << " requires a value\n";
      parsed.ok = false;
      continue;
    }
    const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    parsed.ok = opt->handler(parsed.config, value) && parsed.ok;
  }

  return parsed;
}

template <typename Config>
void print_usage(std::ostream& os, const std::string& command,
                 const std::vector<Option<Config>>& options) {
  os << "Usage: stylegate_cli " << command << " [options]\n";
  for (const auto& opt : options) {
    std::string flag = opt.name;
    if (opt.requires_value) {
      flag += " " + opt.value_hint;
    }
    os << "  " << flag;
    if (flag.size() < 28) {
      os << std::string(28 - flag.size(), ' ');
    } else {
      os << "  ";
    }
    os << opt.description << "\n";
  }
}

}  // namespace stylegate::apps
