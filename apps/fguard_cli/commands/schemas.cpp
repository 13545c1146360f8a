#include "schemas.h"

#include "fguard/core/clock.h"
#include "fguard/schema/schema_json.h"

#include <nlohmann/json.hpp>

#include "exit_codes.h"
#include "shared/arg_parser.h"
#include "shared/registry_loader.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct SchemasCliConfig {
  std::optional<std::string> name;
  std::vector<std::string> schema_files;
};

}  // namespace

int cmd_schemas(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<fguard::apps::Option<SchemasCliConfig>> options = {
      {"--name", true, "Describe a single schema",
       [](SchemasCliConfig& c, const std::string& v) {
         c.name = v;
         return true;
       }},
      {"--schema-file", true, "JSON file with extra schema definitions (repeatable)",
       [](SchemasCliConfig& c, const std::string& v) {
         c.schema_files.push_back(v);
         return true;
       }},
  };
  const auto parsed = fguard::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    return kExitError;
  }

  fguard::core::SystemClock clock;
  auto registry = fguard::apps::load_registry(clock, parsed.config.schema_files);
  if (!registry.has_value()) {
    std::cerr << "Error: " << registry.error() << "\n";
    return kExitError;
  }

  if (parsed.config.name.has_value()) {
    const auto* schema = registry.value().find(parsed.config.name.value());
    if (schema == nullptr) {
      std::cerr << "Error: unknown schema '" << parsed.config.name.value() << "'\n";
      return kExitError;
    }
    std::cout << fguard::schema::schema_to_json(*schema).dump(2) << "\n";
    return kExitValid;
  }

  nlohmann::json out;
  out["schemas"] = registry.value().names();
  std::cout << out.dump(2) << "\n";
  return kExitValid;
}
