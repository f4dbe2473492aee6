#include "input_files.h"

#include "stylegate/io/json_codec.h"

#include <fstream>
#include <sstream>

using stylegate::core::Result;

Result<std::string, std::string> read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string, std::string>::err("Cannot open " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string, std::string>::err("Failed to read " + path);
  }
  return Result<std::string, std::string>::ok(buffer.str());
}

namespace {

// Reads path and hands its text to parse, prefixing any error with the path.
template <typename T, typename Parse>
Result<T, std::string> load_with(const std::string& path, Parse parse) {
  const auto text = read_text_file(path);
  if (!text.has_value()) {
    return Result<T, std::string>::err(text.error());
  }
  auto parsed = parse(text.value());
  if (!parsed.has_value()) {
    return Result<T, std::string>::err(path + ": " + parsed.error());
  }
  return parsed;
}

}  // namespace

Result<std::vector<stylegate::domain::WardrobeItem>, std::string> load_wardrobe_file(
    const std::string& path) {
  return load_with<std::vector<stylegate::domain::WardrobeItem>>(
      path, [](const std::string& text) { return stylegate::io::parse_wardrobe(text); });
}

Result<std::vector<stylegate::domain::OutfitDraft>, std::string> load_drafts_file(
    const std::string& path) {
  return load_with<std::vector<stylegate::domain::OutfitDraft>>(
      path, [](const std::string& text) { return stylegate::io::parse_drafts(text); });
}

Result<stylegate::scoring::PreferenceSet, std::string> load_preferences_file(
    const std::string& path) {
  return load_with<stylegate::scoring::PreferenceSet>(
      path, [](const std::string& text) { return stylegate::io::parse_preferences(text); });
}
