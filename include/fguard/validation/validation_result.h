#pragma once

#include "fguard/validation/error_code.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace fguard::core {
class IClock;
}  // namespace fguard::core

namespace fguard::validation {

struct ValidationErrorItem {
  std::string field;
  std::string message;
  nlohmann::json value;  // The (possibly transformed) value that failed
  ErrorCode code{ErrorCode::kValidationFailed};
};

// Snapshot of one validation run.
// Invariant: is_valid == errors.empty().
// sanitized_data holds every input field, transformed where a rule had a transform,
// regardless of validity.
struct ValidationResult {
  bool is_valid{true};
  std::vector<ValidationErrorItem> errors;
  nlohmann::json sanitized_data = nlohmann::json::object();
};

// Default status carried by an aggregated failure ("unprocessable").
constexpr int kUnprocessableStatus = 422;

// ValidationFailed is raised only on request (Validator::throw_if_invalid, strict
// boundary calls). It carries the full error list and a status for the transport layer.
class ValidationFailed : public std::runtime_error {
 public:
  ValidationFailed(const std::string& message, std::vector<ValidationErrorItem> errors,
                   int status_code = kUnprocessableStatus);

  [[nodiscard]] const std::vector<ValidationErrorItem>& errors() const noexcept { return errors_; }
  [[nodiscard]] int status_code() const noexcept { return status_code_; }

 private:
  std::vector<ValidationErrorItem> errors_;
  int status_code_;
};

// {"field", "message", "value", "code"}
[[nodiscard]] nlohmann::json error_item_to_json(const ValidationErrorItem& item);

// {"isValid", "errors", "sanitizedData"}
[[nodiscard]] nlohmann::json validation_result_to_json(const ValidationResult& result);

// {"status": "error", "message", "statusCode", "errors", "timestamp"}
// The timestamp is read from the injected clock.
[[nodiscard]] nlohmann::json validation_failed_to_json(const ValidationFailed& failure,
                                                       core::IClock& clock);

}  // namespace fguard::validation
