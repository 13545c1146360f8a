#pragma once

#include "config.h"
#include <string>

namespace fguard::mcp {

// validate_mcp_server_config checks startup preconditions for the MCP server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - every flag parsed cleanly (no unknown flags, no missing values)
// - if now is present, it parses as an ISO-8601 instant
//
// Schema files are checked when they are loaded, not here.
[[nodiscard]] std::string validate_mcp_server_config(const McpServerConfig& config);

}  // namespace fguard::mcp
