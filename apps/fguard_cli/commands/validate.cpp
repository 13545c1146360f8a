#include "validate.h"

#include "fguard/core/clock.h"
#include "fguard/core/time.h"

#include "exit_codes.h"
#include "shared/arg_parser.h"
#include "shared/json_input.h"
#include "shared/registry_loader.h"
#include "validate_logic.h"
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ValidateCliConfig {
  std::optional<std::string> schema_name;
  std::vector<std::string> schema_files;
  std::string input_path{"-"};
  std::optional<std::string> now;
  ValidateFlags flags;
};

std::vector<fguard::apps::Option<ValidateCliConfig>> build_options() {
  return {
      {"--schema", true, "Name of the schema to apply",
       [](ValidateCliConfig& c, const std::string& v) {
         c.schema_name = v;
         return true;
       }},
      {"--schema-file", true, "JSON file with extra schema definitions (repeatable)",
       [](ValidateCliConfig& c, const std::string& v) {
         c.schema_files.push_back(v);
         return true;
       }},
      {"--input", true, "JSON input file, or - for stdin (default: -)",
       [](ValidateCliConfig& c, const std::string& v) {
         c.input_path = v;
         return true;
       }},
      {"--now", true, "Pin the clock to an ISO-8601 instant",
       [](ValidateCliConfig& c, const std::string& v) {
         if (!fguard::core::parse_timestamp(v).has_value()) {
           return false;
         }
         c.now = v;
         return true;
       }},
      {"--sanitize", false, "Sanitize strings before validating",
       [](ValidateCliConfig& c, const std::string& /*v*/) {
         c.flags.sanitize = true;
         return true;
       }},
      {"--update", false, "Validate as a partial update (only present fields)",
       [](ValidateCliConfig& c, const std::string& /*v*/) {
         c.flags.update = true;
         return true;
       }},
      {"--strict", false, "Report failures as an aggregated error document",
       [](ValidateCliConfig& c, const std::string& /*v*/) {
         c.flags.strict = true;
         return true;
       }},
      {"--request", false, "Input is {\"body\", \"query\", \"params\"}",
       [](ValidateCliConfig& c, const std::string& /*v*/) {
         c.flags.request = true;
         return true;
       }},
  };
}

}  // namespace

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_options();
  const auto parsed = fguard::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    std::cerr << "Usage: fguard_cli validate [options]\n" << fguard::apps::describe_options(options);
    return kExitError;
  }
  const ValidateCliConfig& config = parsed.config;

  if (!config.schema_name.has_value()) {
    std::cerr << "Error: --schema <name> is required\n";
    return kExitError;
  }

  std::unique_ptr<fguard::core::IClock> clock;
  if (config.now.has_value()) {
    clock = std::make_unique<fguard::core::FixedClock>(config.now.value());
  } else {
    clock = std::make_unique<fguard::core::SystemClock>();
  }

  auto registry = fguard::apps::load_registry(*clock, config.schema_files);
  if (!registry.has_value()) {
    std::cerr << "Error: " << registry.error() << "\n";
    return kExitError;
  }

  const auto* schema = registry.value().find(config.schema_name.value());
  if (schema == nullptr) {
    std::cerr << "Error: unknown schema '" << config.schema_name.value() << "'\n";
    return kExitError;
  }

  auto input = fguard::apps::read_json_input(config.input_path);
  if (!input.has_value()) {
    std::cerr << "Error: " << input.error() << "\n";
    return kExitError;
  }

  try {
    const auto outcome = execute_validate(input.value(), *schema, config.flags, *clock);
    if (!outcome.error.empty()) {
      std::cerr << "Error: " << outcome.error << "\n";
      return outcome.exit_code;
    }
    std::cout << outcome.output.dump(2) << "\n";
    return outcome.exit_code;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitError;
  }
}
