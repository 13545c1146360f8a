#include "fguard/validation/validation_result.h"

#include "fguard/core/clock.h"

#include <utility>

namespace fguard::validation {

using json = nlohmann::json;

ValidationFailed::ValidationFailed(const std::string& message,
                                   std::vector<ValidationErrorItem> errors, int status_code)
    : std::runtime_error(message), errors_(std::move(errors)), status_code_(status_code) {}

json error_item_to_json(const ValidationErrorItem& item) {
  json j;
  j["code"] = std::string(to_string(item.code));
  j["field"] = item.field;
  j["message"] = item.message;
  j["value"] = item.value;
  return j;
}

namespace {

json errors_to_json(const std::vector<ValidationErrorItem>& errors) {
  json out = json::array();
  for (const auto& item : errors) {
    out.push_back(error_item_to_json(item));
  }
  return out;
}

}  // namespace

json validation_result_to_json(const ValidationResult& result) {
  json j;
  j["errors"] = errors_to_json(result.errors);
  j["isValid"] = result.is_valid;
  j["sanitizedData"] = result.sanitized_data;
  return j;
}

json validation_failed_to_json(const ValidationFailed& failure, core::IClock& clock) {
  json j;
  j["errors"] = errors_to_json(failure.errors());
  j["message"] = failure.what();
  j["status"] = "error";
  j["statusCode"] = failure.status_code();
  j["timestamp"] = clock.now_iso8601();
  return j;
}

}  // namespace fguard::validation
