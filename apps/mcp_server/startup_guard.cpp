#include "startup_guard.h"

#include "fguard/core/time.h"

namespace fguard::mcp {

std::string validate_mcp_server_config(const McpServerConfig& config) {
  if (!config.parse_errors.empty()) {
    return "Error: " + config.parse_errors.front() +
           "\n"
           "       Accepted flags: --now <iso8601>, --strict, --schema-file <path>";
  }

  if (config.now.has_value() && !core::parse_timestamp(config.now.value()).has_value()) {
    return "Error: --now '" + config.now.value() +
           "' is not a valid ISO-8601 instant.\n"
           "       Accepted formats: 2026-01-01, 2026-01-01T00:00:00Z, "
           "2026-01-01T00:00:00.000+02:00";
  }

  return "";
}

}  // namespace fguard::mcp
