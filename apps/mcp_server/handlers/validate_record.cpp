#include "validate_record.h"

#include "fguard/boundary/request_adapter.h"
#include "fguard/schema/schema_json.h"
#include "fguard/validation/validation_result.h"

#include <optional>
#include <string>
#include <utility>

namespace fguard::mcp::handlers {

using json = nlohmann::json;

namespace {

json error_result(const std::string& message) {
  json result;
  result["error"] = message;
  return result;
}

// Boolean argument, `fallback` when absent. nullopt when present but not a boolean.
std::optional<bool> bool_arg(const json& params, const char* key, bool fallback) {
  if (!params.contains(key)) {
    return fallback;
  }
  if (!params.at(key).is_boolean()) {
    return std::nullopt;
  }
  return params.at(key).get<bool>();
}

}  // namespace

// Strict calls throw validation::ValidationFailed for an invalid record; the server
// loop turns it into a JSON-RPC kInvalidParams error.
json handle_validate_record(const json& params, ServerContext& ctx) {
  schema::Schema inline_schema;
  const schema::Schema* schema = nullptr;

  if (params.contains("schema_definition")) {
    auto parsed = schema::schema_from_json("inline", params.at("schema_definition"));
    if (!parsed.has_value()) {
      return error_result("Invalid schema_definition: " + parsed.error());
    }
    inline_schema = std::move(parsed.value());
    schema = &inline_schema;
  } else if (params.contains("schema") && params.at("schema").is_string()) {
    const auto name = params.at("schema").get<std::string>();
    schema = ctx.registry.find(name);
    if (schema == nullptr) {
      return error_result("Unknown schema: " + name);
    }
  } else {
    return error_result("Either 'schema' or 'schema_definition' is required");
  }

  if (!params.contains("data")) {
    return error_result("'data' is required");
  }

  const auto sanitize = bool_arg(params, "sanitize", false);
  const auto update = bool_arg(params, "update", false);
  const auto strict = bool_arg(params, "strict", ctx.config.strict);
  if (!sanitize.has_value() || !update.has_value() || !strict.has_value()) {
    return error_result("'sanitize', 'update' and 'strict' must be booleans");
  }

  boundary::RequestSources sources;
  sources.body = params.at("data");
  sources.query = params.value("query", json(nullptr));
  sources.params = params.value("params", json(nullptr));

  const boundary::RequestOptions options{sanitize.value(), update.value()};
  auto result = boundary::validate_request(sources, *schema, options);
  if (!result.has_value()) {
    return error_result(result.error());
  }

  if (strict.value() && !result.value().is_valid) {
    throw validation::ValidationFailed("Validation failed", result.value().errors);
  }
  return validation::validation_result_to_json(result.value());
}

}  // namespace fguard::mcp::handlers
