#pragma once

#include "fguard/core/clock.h"
#include "fguard/schema/schema_registry.h"

#include "config.h"

namespace fguard::mcp {

// ServerContext holds all process-lifetime references passed to every tool handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  const schema::SchemaRegistry& registry;  // NOLINT(readability-identifier-naming)
  core::IClock& clock;                     // NOLINT(readability-identifier-naming)
  const McpServerConfig& config;           // NOLINT(readability-identifier-naming)
};

}  // namespace fguard::mcp
