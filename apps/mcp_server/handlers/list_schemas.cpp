#include "list_schemas.h"

#include "fguard/schema/schema_json.h"

#include <string>

namespace fguard::mcp::handlers {

using json = nlohmann::json;

json handle_list_schemas(const json& params, ServerContext& ctx) {
  if (params.contains("name") && params.at("name").is_string()) {
    const auto name = params.at("name").get<std::string>();
    const auto* schema = ctx.registry.find(name);
    if (schema == nullptr) {
      json error_result;
      error_result["error"] = "Unknown schema: " + name;
      return error_result;
    }
    return schema::schema_to_json(*schema);
  }

  json result;
  result["schemas"] = ctx.registry.names();
  return result;
}

}  // namespace fguard::mcp::handlers
