#include "fguard/core/version.h"

#include "commands/check.h"
#include "commands/exit_codes.h"
#include "commands/sanitize.h"
#include "commands/schemas.h"
#include "commands/validate.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "fguard_cli v" << fguard::core::kBuildVersion << "\n"
            << "Usage: fguard_cli <command> [options]\n"
               "Commands:\n"
               "  validate   Validate a JSON record against a schema\n"
               "  check      Check a single value against one rule kind\n"
               "  sanitize   Strip markup and normalize whitespace in a JSON document\n"
               "  schemas    List or describe registered schemas\n"
               "Exit codes: 0 valid, 2 invalid, 1 usage or I/O error\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return kExitError;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "validate") {
    return cmd_validate(argc, argv);
  }
  if (subcommand == "check") {
    return cmd_check(argc, argv);
  }
  if (subcommand == "sanitize") {
    return cmd_sanitize(argc, argv);
  }
  if (subcommand == "schemas") {
    return cmd_schemas(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return kExitValid;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return kExitError;
}
