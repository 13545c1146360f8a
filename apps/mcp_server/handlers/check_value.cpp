#include "check_value.h"

#include "fguard/validation/rule_kind.h"
#include "fguard/validation/validation_result.h"
#include "fguard/validation/validator.h"

#include <exception>
#include <string>

namespace fguard::mcp::handlers {

using json = nlohmann::json;

json handle_check_value(const json& params, ServerContext& /*ctx*/) {
  try {
    const auto kind_name = params.at("kind").get<std::string>();
    const auto kind = validation::kind_from_name(kind_name);
    if (!kind.has_value()) {
      json error_result;
      error_result["error"] = "Unknown kind: " + kind_name;
      return error_result;
    }

    validation::ValidationRule rule;
    rule.kind = kind.value();
    rule.required = true;
    if (params.contains("min")) {
      rule.min = params.at("min").get<double>();
    }
    if (params.contains("max")) {
      rule.max = params.at("max").get<double>();
    }
    if (params.contains("pattern")) {
      rule.pattern = validation::make_pattern(params.at("pattern").get<std::string>());
    }

    json record = json::object();
    record["value"] = params.at("value");
    validation::Validator validator(record);
    validator.validate_field("value", rule);
    const auto result = validator.result();

    json out;
    out["kind"] = kind_name;
    out["valid"] = result.is_valid;
    out["value"] = result.sanitized_data.at("value");
    if (!result.is_valid) {
      out["error"] = validation::error_item_to_json(result.errors.front());
    }
    return out;

  } catch (const std::exception& e) {
    json error_result;
    error_result["error"] = e.what();
    return error_result;
  }
}

}  // namespace fguard::mcp::handlers
