#include "commands/classify.h"
#include "commands/coverage.h"
#include "commands/evaluate.h"
#include "stylegate/core/version.h"

#include <iostream>
#include <string>

namespace {

void print_help() {
  std::cerr << "stylegate " << stylegate::core::kBuildVersion << "\n"
            << "Usage: stylegate_cli <command> [options]\n"
            << "Commands:\n"
            << "  classify   Classify wardrobe records into the canonical taxonomy\n"
            << "  coverage   Profile which outfit slots a wardrobe can fill\n"
            << "  evaluate   Rank candidate outfits and ground the best against the wardrobe\n"
            << "Run 'stylegate_cli <command>' without options for its flags.\n";
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(bugprone-exception-escape)
  if (argc < 2) {
    print_help();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "classify") {
    return cmd_classify(argc, argv);
  }
  if (subcommand == "coverage") {
    return cmd_coverage(argc, argv);
  }
  if (subcommand == "evaluate") {
    return cmd_evaluate(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << stylegate::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand != "--help" && subcommand != "-h") {
    std::cerr << "Unknown command: " << subcommand << "\n";
  }
  print_help();
  return subcommand == "--help" || subcommand == "-h" ? 0 : 1;
}
