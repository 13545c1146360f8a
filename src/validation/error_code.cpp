#include "fguard/validation/error_code.h"

#include <array>
#include <utility>

namespace fguard::validation {

namespace {

constexpr std::array<std::pair<ErrorCode, std::string_view>, 17> kCodeNames{{
    {ErrorCode::kRequired, "REQUIRED"},
    {ErrorCode::kInvalidEmail, "INVALID_EMAIL"},
    {ErrorCode::kInvalidUrl, "INVALID_URL"},
    {ErrorCode::kInvalidDate, "INVALID_DATE"},
    {ErrorCode::kInvalidCpf, "INVALID_CPF"},
    {ErrorCode::kInvalidCnpj, "INVALID_CNPJ"},
    {ErrorCode::kInvalidCep, "INVALID_CEP"},
    {ErrorCode::kInvalidPhone, "INVALID_PHONE"},
    {ErrorCode::kInvalidIsbn, "INVALID_ISBN"},
    {ErrorCode::kInvalidUuid, "INVALID_UUID"},
    {ErrorCode::kInvalidJson, "INVALID_JSON"},
    {ErrorCode::kInvalidBase64, "INVALID_BASE64"},
    {ErrorCode::kWeakPassword, "WEAK_PASSWORD"},
    {ErrorCode::kInvalidEnumValue, "INVALID_ENUM_VALUE"},
    {ErrorCode::kPatternMismatch, "PATTERN_MISMATCH"},
    {ErrorCode::kCustomValidationFailed, "CUSTOM_VALIDATION_FAILED"},
    {ErrorCode::kValidationFailed, "VALIDATION_FAILED"},
}};

}  // namespace

std::string_view to_string(const ErrorCode code) noexcept {
  for (const auto& [value, name] : kCodeNames) {
    if (value == code) {
      return name;
    }
  }
  return "VALIDATION_FAILED";
}

std::optional<ErrorCode> error_code_from_string(const std::string_view name) noexcept {
  for (const auto& [value, code_name] : kCodeNames) {
    if (code_name == name) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace fguard::validation
