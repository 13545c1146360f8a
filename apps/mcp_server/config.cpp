#include "config.h"

#include "shared/arg_parser.h"
#include <string>
#include <utility>
#include <vector>

namespace fguard::mcp {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_now(McpServerConfig& config, const std::string& value) {
  config.now = value;
  return true;
}

bool handle_strict(McpServerConfig& config, const std::string& /*value*/) {
  config.strict = true;
  return true;
}

bool handle_schema_file(McpServerConfig& config, const std::string& value) {
  if (value.empty()) {
    return false;
  }
  config.schema_files.push_back(value);
  return true;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<McpServerConfig>> build_option_registry() {
  return {
      {"--now", true, "Pin the clock to an ISO-8601 instant", handle_now},
      {"--strict", false, "Report invalid records as JSON-RPC errors by default", handle_strict},
      {"--schema-file", true, "JSON file with extra schema definitions (repeatable)",
       handle_schema_file},
  };
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

McpServerConfig parse_args(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_option_registry();
  auto parsed = apps::parse_options(argc, argv, options);
  McpServerConfig config = std::move(parsed.config);
  config.parse_errors = std::move(parsed.errors);
  return config;
}

}  // namespace fguard::mcp
