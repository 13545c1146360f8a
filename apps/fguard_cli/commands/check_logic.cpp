#include "check_logic.h"

#include "fguard/validation/error_code.h"
#include "fguard/validation/rule_kind.h"
#include "fguard/validation/validation_result.h"
#include "fguard/validation/validator.h"

#include <regex>

#include "exit_codes.h"

using json = nlohmann::json;
using namespace fguard;

CommandOutcome execute_check(const CheckRequest& request) {
  const auto kind = validation::kind_from_name(request.kind);
  if (!kind.has_value()) {
    return CommandOutcome{kExitError, json(), "unknown kind '" + request.kind + "'"};
  }

  json value = request.value;
  if (request.value_is_json) {
    value = json::parse(request.value, nullptr, /*allow_exceptions=*/false);
    if (value.is_discarded()) {
      return CommandOutcome{kExitError, json(), "--value is not valid JSON"};
    }
  }

  validation::ValidationRule rule;
  rule.kind = kind.value();
  rule.required = true;
  rule.min = request.min;
  rule.max = request.max;
  if (request.pattern.has_value()) {
    try {
      rule.pattern = validation::make_pattern(request.pattern.value());
    } catch (const std::regex_error& e) {
      return CommandOutcome{kExitError, json(), std::string("invalid --pattern: ") + e.what()};
    }
  }

  json record = json::object();
  record["value"] = value;
  validation::Validator validator(record);
  validator.validate_field("value", rule);
  const auto result = validator.result();

  json out;
  out["kind"] = request.kind;
  out["valid"] = result.is_valid;
  out["value"] = result.sanitized_data.at("value");
  if (!result.is_valid) {
    out["error"] = validation::error_item_to_json(result.errors.front());
  }
  return CommandOutcome{result.is_valid ? kExitValid : kExitInvalid, out, ""};
}
