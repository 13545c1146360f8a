#include "method_handlers.h"

#include "fguard/core/version.h"

#include "handlers/tool_registry.h"

namespace fguard::mcp {

using json = nlohmann::json;

json handle_initialize(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return json{
      {"protocolVersion", "2024-11-05"},
      {"capabilities", {{"tools", json::object()}}},
      {"serverInfo", {{"name", core::kServerName}, {"version", core::kBuildVersion}}},
  };
}

json handle_tools_list(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  json tools = json::array();

  tools.push_back({
      {"name", "validate_record"},
      {"description",
       "Validate a record against a registered schema or an inline schema definition"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties",
            {
                {"schema", {{"type", "string"}, {"description", "Registered schema name"}}},
                {"schema_definition",
                 {{"type", "object"},
                  {"description", "Inline {field: rule | [rules]} definition"}}},
                {"data", {{"type", "object"}}},
                {"query", {{"type", "object"}}},
                {"params", {{"type", "object"}}},
                {"sanitize", {{"type", "boolean"}}},
                {"update", {{"type", "boolean"}}},
                {"strict", {{"type", "boolean"}}},
            }},
           {"required", json::array({"data"})},
       }},
  });

  tools.push_back({
      {"name", "check_value"},
      {"description", "Check a single value against one rule kind"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties",
            {
                {"kind", {{"type", "string"}}},
                {"value", json::object()},
                {"min", {{"type", "number"}}},
                {"max", {{"type", "number"}}},
                {"pattern", {{"type", "string"}}},
            }},
           {"required", json::array({"kind", "value"})},
       }},
  });

  tools.push_back({
      {"name", "sanitize_input"},
      {"description", "Strip markup and normalize whitespace in every string of a document"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties", {{"data", json::object()}}},
           {"required", json::array({"data"})},
       }},
  });

  tools.push_back({
      {"name", "list_schemas"},
      {"description", "List registered schemas, or describe one by name"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties", {{"name", {{"type", "string"}}}}},
       }},
  });

  return json{{"tools", tools}};
}

json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx) {
  const std::string tool_name =
      req.params.contains("name") && req.params["name"].is_string()
          ? req.params["name"].get<std::string>()
          : std::string();
  json tool_params = req.params.value("arguments", json::object());

  // Tool registry
  static const auto tool_registry = handlers::build_tool_registry();

  auto it = tool_registry.find(tool_name);
  if (it == tool_registry.end()) {
    json error_result;
    error_result["error"] = "Unknown tool: " + tool_name;
    return error_result;
  }

  return it->second(tool_params, ctx);
}

std::unordered_map<std::string, MethodHandler> build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
  };
}

}  // namespace fguard::mcp
