#pragma once

#include "fguard/schema/schema.h"
#include "fguard/validation/validation_result.h"
#include "fguard/validation/validation_rule.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace fguard::validation {

// Validator evaluates rules against one input mapping.
//
// It is a class (not struct) because it accumulates errors and sanitized values for
// the lifetime of a single validation run. A fresh instance is built per call; nothing
// is shared between instances, so independent runs may execute on different threads.
//
// Field failures are recorded as data. Nothing here throws except the constructor
// (non-object input) and throw_if_invalid() on request.
class Validator {
 public:
  // Throws std::invalid_argument if `data` is not a JSON object.
  explicit Validator(nlohmann::json data);

  // Evaluate rules in order against the field's current value. The first failing rule
  // appends exactly one error; later rules for this field are not evaluated.
  Validator& validate_field(const std::string& field, const ValidationRule& rule);
  Validator& validate_field(const std::string& field, const FieldRules& rules);

  // Every field spec in schema order, then the schema's record checks.
  Validator& validate_fields(const schema::Schema& schema);

  // Record-level predicate over the whole input. Appends at most one error. A check
  // that throws is reported as CUSTOM_VALIDATION_FAILED with an empty field name.
  Validator& custom(const schema::RecordCheck& check);

  [[nodiscard]] ValidationResult result() const;

  // Throws ValidationFailed (status 422) carrying every error if the run is invalid.
  void throw_if_invalid(const std::string& message = "Validation failed") const;

 private:
  // Returns the error for the first failing step, or nullopt when the rule passes.
  // `current` is the value under evaluation; a transform replaces it in place.
  std::optional<ValidationErrorItem> apply_rule(const std::string& field,
                                                const ValidationRule& rule,
                                                nlohmann::json& current);

  nlohmann::json data_;
  nlohmann::json sanitized_;
  std::vector<ValidationErrorItem> errors_;
};

// Single value, single rule. Returns true when the rule passes.
[[nodiscard]] bool validate_value(const nlohmann::json& value, const ValidationRule& rule);

// One-shot: build a Validator, apply the schema, return the result.
// Throws std::invalid_argument if `data` is not a JSON object.
[[nodiscard]] ValidationResult validate_object(const nlohmann::json& data,
                                               const schema::Schema& schema);

}  // namespace fguard::validation
