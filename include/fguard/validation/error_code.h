#pragma once

#include <optional>
#include <string_view>

namespace fguard::validation {

// ErrorCode is the closed taxonomy reported in ValidationErrorItem::code.
// Wire names are the SCREAMING_SNAKE strings returned by to_string().
enum class ErrorCode {
  kRequired,
  kInvalidEmail,
  kInvalidUrl,
  kInvalidDate,
  kInvalidCpf,
  kInvalidCnpj,
  kInvalidCep,
  kInvalidPhone,
  kInvalidIsbn,
  kInvalidUuid,
  kInvalidJson,
  kInvalidBase64,
  kWeakPassword,
  kInvalidEnumValue,
  kPatternMismatch,
  kCustomValidationFailed,
  kValidationFailed,
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

[[nodiscard]] std::optional<ErrorCode> error_code_from_string(std::string_view name) noexcept;

}  // namespace fguard::validation
