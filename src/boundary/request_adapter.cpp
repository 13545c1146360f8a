#include "fguard/boundary/request_adapter.h"

#include "fguard/sanitize/sanitizer.h"
#include "fguard/validation/validator.h"

#include <utility>

namespace fguard::boundary {

using json = nlohmann::json;
using MergeResult = core::Result<json, std::string>;
using RequestResult = core::Result<validation::ValidationResult, std::string>;

namespace {

// Later calls overwrite earlier keys.
std::string overlay(json& target, const json& source, const char* label) {
  if (source.is_null()) {
    return {};
  }
  if (!source.is_object()) {
    return std::string(label) + " must be a JSON object";
  }
  for (const auto& item : source.items()) {
    target[item.key()] = item.value();
  }
  return {};
}

}  // namespace

MergeResult merge_sources(const RequestSources& sources) {
  json merged = json::object();
  std::string error = overlay(merged, sources.body, "body");
  if (error.empty()) {
    error = overlay(merged, sources.query, "query");
  }
  if (error.empty()) {
    error = overlay(merged, sources.params, "params");
  }
  if (!error.empty()) {
    return MergeResult::err(error);
  }
  return MergeResult::ok(std::move(merged));
}

RequestResult validate_request(const RequestSources& sources, const schema::Schema& schema,
                               const RequestOptions& options) {
  auto merged = merge_sources(sources);
  if (!merged.has_value()) {
    return RequestResult::err(merged.error());
  }

  json data = options.sanitize ? sanitize::sanitize(merged.value()) : std::move(merged.value());

  validation::Validator validator(data);
  if (options.update) {
    validator.validate_fields(schema::derive_update_schema(schema, data));
  } else {
    validator.validate_fields(schema);
  }
  return RequestResult::ok(validator.result());
}

}  // namespace fguard::boundary
