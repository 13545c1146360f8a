#pragma once

#include "fguard/validation/error_code.h"

#include <optional>
#include <string_view>
#include <variant>

namespace fguard::validation {

// One tag type per semantic kind a rule can check.
// Each tag carries its wire name, the error code reported when its checker fails,
// and the tail of the default message ("<field> <kDefaultMessage>").
namespace kinds {

struct String {
  static constexpr std::string_view kName = "string";
  static constexpr ErrorCode kCode = ErrorCode::kValidationFailed;
  static constexpr std::string_view kDefaultMessage = "must be a valid string";
};

struct Number {
  static constexpr std::string_view kName = "number";
  static constexpr ErrorCode kCode = ErrorCode::kValidationFailed;
  static constexpr std::string_view kDefaultMessage = "must be a valid number";
};

struct Boolean {
  static constexpr std::string_view kName = "boolean";
  static constexpr ErrorCode kCode = ErrorCode::kValidationFailed;
  static constexpr std::string_view kDefaultMessage = "must be true or false";
};

struct Email {
  static constexpr std::string_view kName = "email";
  static constexpr ErrorCode kCode = ErrorCode::kInvalidEmail;
  static constexpr std::string_view kDefaultMessage = "must be a valid email";
};

struct Url {
  static constexpr std::string_view kName = "url";
  static constexpr ErrorCode kCode = ErrorCode::kInvalidUrl;
  static constexpr std::string_view kDefaultMessage = "must be a valid URL";
};

struct Date {
  static constexpr std::string_view kName = "date";
  static constexpr ErrorCode kCode = ErrorCode::kInvalidDate;
  static constexpr std::string_view kDefaultMessage = "must be a valid date";
};

struct Cpf {
  static constexpr std::string_view kName = "cpf";
  static constexpr ErrorCode kCode = ErrorCode::kInvalidCpf;
  static constexpr std::string_view kDefaultMessage = "must be a valid CPF";
};

struct Cnpj {
  static constexpr std::string_view kName = "cnpj";
  static constexpr ErrorCode kCode = ErrorCode::kInvalidCnpj;
  static constexpr std::string_view kDefaultMessage = "must be a valid CNPJ";
};

struct Cep {
  static constexpr std::string_view kName = "cep";
  static constexpr ErrorCode kCode = ErrorCode::kInvalidCep;
  static constexpr std::string_view kDefaultMessage = "must be a valid CEP";
};

struct Phone {
  static constexpr std::string_view kName = "phone";
  static constexpr ErrorCode kCode = ErrorCode::kInvalidPhone;
  static constexpr std::string_view kDefaultMessage = "must be a valid phone number";
};

struct Isbn {
  static constexpr std::string_view kName = "isbn";
  static constexpr ErrorCode kCode = ErrorCode::kInvalidIsbn;
  static constexpr std::string_view kDefaultMessage = "must be a valid ISBN";
};

struct Uuid {
  static constexpr std::string_view kName = "uuid";
  static constexpr ErrorCode kCode = ErrorCode::kInvalidUuid;
  static constexpr std::string_view kDefaultMessage = "must be a valid UUID";
};

struct Json {
  static constexpr std::string_view kName = "json";
  static constexpr ErrorCode kCode = ErrorCode::kInvalidJson;
  static constexpr std::string_view kDefaultMessage = "must be valid JSON";
};

struct Base64 {
  static constexpr std::string_view kName = "base64";
  static constexpr ErrorCode kCode = ErrorCode::kInvalidBase64;
  static constexpr std::string_view kDefaultMessage = "must be a valid base64 string";
};

struct Password {
  static constexpr std::string_view kName = "password";
  static constexpr ErrorCode kCode = ErrorCode::kWeakPassword;
  static constexpr std::string_view kDefaultMessage = "must be a strong password";
};

}  // namespace kinds

// RuleKind is a closed sum type. Dispatch goes through std::visit with one overload
// per alternative, so adding a kind fails to compile until every visitor handles it.
using RuleKind = std::variant<kinds::String, kinds::Number, kinds::Boolean, kinds::Email,
                              kinds::Url, kinds::Date, kinds::Cpf, kinds::Cnpj, kinds::Cep,
                              kinds::Phone, kinds::Isbn, kinds::Uuid, kinds::Json,
                              kinds::Base64, kinds::Password>;

[[nodiscard]] std::string_view kind_name(const RuleKind& kind) noexcept;

[[nodiscard]] ErrorCode kind_error_code(const RuleKind& kind) noexcept;

// Resolve a wire name ("cpf", "isbn", ...) to its kind. Names are case-sensitive.
[[nodiscard]] std::optional<RuleKind> kind_from_name(std::string_view name);

}  // namespace fguard::validation
