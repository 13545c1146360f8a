#pragma once

#include "fguard/core/result.h"
#include "fguard/schema/schema.h"
#include "fguard/validation/validation_result.h"
#include "fguard/validation/validator.h"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace fguard::boundary {

// Raw inputs of one request. Each source is a JSON object or null (absent).
struct RequestSources {
  nlohmann::json body = nullptr;
  nlohmann::json query = nullptr;
  nlohmann::json params = nullptr;
};

struct RequestOptions {
  bool sanitize{false};  // run sanitize::sanitize() over the merged mapping first
  bool update{false};    // validate against derive_update_schema(schema, merged)
};

// Flatten the sources into one mapping. Precedence: params > query > body.
// Fails when a present source is not a JSON object.
[[nodiscard]] core::Result<nlohmann::json, std::string> merge_sources(
    const RequestSources& sources);

// merge -> optional sanitize -> validate. Source shape problems are reported as an
// error string; field problems are in the ValidationResult.
[[nodiscard]] core::Result<validation::ValidationResult, std::string> validate_request(
    const RequestSources& sources, const schema::Schema& schema,
    const RequestOptions& options = {});

// Wraps `fn` so it only ever sees validated data: the returned callable validates its
// argument against `schema`, throws validation::ValidationFailed when invalid, and
// otherwise forwards the sanitized data to `fn`.
//
//   auto create = with_validation(book_schema, [&](const nlohmann::json& book) { ... });
template <typename Fn>
auto with_validation(schema::Schema schema, Fn fn, std::string message = "Validation failed") {
  return [schema = std::move(schema), fn = std::move(fn),
          message = std::move(message)](const nlohmann::json& data) {
    validation::Validator validator(data);
    validator.validate_fields(schema);
    validator.throw_if_invalid(message);
    return fn(validator.result().sanitized_data);
  };
}

}  // namespace fguard::boundary
