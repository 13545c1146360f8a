#include "tool_registry.h"

#include "check_value.h"
#include "list_schemas.h"
#include "sanitize_input.h"
#include "validate_record.h"

namespace fguard::mcp::handlers {

std::unordered_map<std::string, ToolHandler> build_tool_registry() {
  return {
      {"validate_record", handle_validate_record},
      {"check_value", handle_check_value},
      {"sanitize_input", handle_sanitize_input},
      {"list_schemas", handle_list_schemas},
  };
}

}  // namespace fguard::mcp::handlers
