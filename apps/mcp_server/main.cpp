#include "fguard/core/clock.h"
#include "fguard/core/version.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "shared/registry_loader.h"
#include "startup_guard.h"
#include <iostream>
#include <memory>
#include <string>

using namespace fguard;

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  const auto config = mcp::parse_args(argc, argv);

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = mcp::validate_mcp_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  std::unique_ptr<core::IClock> clock;
  if (config.now.has_value()) {
    clock = std::make_unique<core::FixedClock>(config.now.value());
  } else {
    clock = std::make_unique<core::SystemClock>();
  }

  // Registry is built once and read-only for the rest of the process.
  auto registry = apps::load_registry(*clock, config.schema_files);
  if (!registry.has_value()) {
    std::cerr << "Error: failed to load schemas: " << registry.error() << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "fguard MCP Server v" << core::kBuildVersion << "\n";
  if (config.now.has_value()) {
    std::cerr << "Clock:       fixed -- " << config.now.value() << "\n";
  } else {
    std::cerr << "Clock:       system\n";
  }
  std::cerr << "Schemas:     " << registry.value().size() << " registered";
  if (!config.schema_files.empty()) {
    std::cerr << " (" << config.schema_files.size() << " schema file(s))";
  }
  std::cerr << "\n";
  std::cerr << "Strict:      " << (config.strict ? "on" : "off") << "\n";
  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  mcp::ServerContext ctx{registry.value(), *clock, config};
  mcp::run_server_loop(ctx, std::cin, std::cout);
  return 0;
}
