#include "validate_logic.h"

#include "fguard/boundary/request_adapter.h"
#include "fguard/validation/validation_result.h"

#include "exit_codes.h"

using json = nlohmann::json;
using namespace fguard;

CommandOutcome execute_validate(const json& input, const schema::Schema& schema,
                                const ValidateFlags& flags, core::IClock& clock) {
  boundary::RequestSources sources;
  if (flags.request) {
    if (!input.is_object()) {
      return CommandOutcome{kExitError, json(), "request input must be a JSON object"};
    }
    sources.body = input.value("body", json(nullptr));
    sources.query = input.value("query", json(nullptr));
    sources.params = input.value("params", json(nullptr));
  } else {
    sources.body = input;
  }

  const boundary::RequestOptions options{flags.sanitize, flags.update};
  auto result = boundary::validate_request(sources, schema, options);
  if (!result.has_value()) {
    return CommandOutcome{kExitError, json(), result.error()};
  }

  const validation::ValidationResult& validation = result.value();
  const int exit_code = validation.is_valid ? kExitValid : kExitInvalid;

  if (flags.strict && !validation.is_valid) {
    const validation::ValidationFailed failure("Validation failed", validation.errors);
    return CommandOutcome{exit_code, validation::validation_failed_to_json(failure, clock), ""};
  }
  return CommandOutcome{exit_code, validation::validation_result_to_json(validation), ""};
}
