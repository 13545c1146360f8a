#pragma once

#include <optional>
#include <string>
#include <vector>

namespace fguard::mcp {

// McpServerConfig holds all parsed startup flags for the MCP server.
// Every field has an explicit default; optional fields mean "not configured".
struct McpServerConfig {
  // Pinned ISO-8601 instant; the system clock is used when absent.
  std::optional<std::string> now;  // NOLINT(readability-identifier-naming)
  // Default for validate_record when the call does not pass "strict".
  bool strict{false};                     // NOLINT(readability-identifier-naming)
  std::vector<std::string> schema_files;  // NOLINT(readability-identifier-naming)
  // Problems found while parsing flags; checked by validate_mcp_server_config().
  std::vector<std::string> parse_errors;  // NOLINT(readability-identifier-naming)
};

McpServerConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

}  // namespace fguard::mcp
