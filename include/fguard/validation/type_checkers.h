#pragma once

#include "fguard/validation/rule_kind.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string_view>

namespace fguard::validation {

// Bounds forwarded from a rule to the checker that interprets them.
struct Bounds {
  std::optional<double> min;
  std::optional<double> max;
};

// Symbols that satisfy the password "special character" requirement.
constexpr std::string_view kPasswordSymbols = "!@#$%^&*(),.?\":{}|<>";
constexpr std::size_t kDefaultPasswordLength = 8;

// ── Text-level checkers ─────────────────────────────────────────────────────
// Pure and total: any input yields true or false, never an exception.

// local@domain.tld with no whitespace, a single '@', a dot inside the domain
// and no ".." anywhere.
[[nodiscard]] bool is_valid_email(std::string_view value);

// Absolute URL: scheme ":" rest. http, https, ws, wss and ftp need a non-empty host
// (with an optional numeric port <= 65535); file and non-special schemes only need
// a well-formed scheme.
[[nodiscard]] bool is_valid_url(std::string_view value);

// See core::parse_timestamp for accepted forms.
[[nodiscard]] bool is_valid_date(std::string_view value);

// 11 digits after stripping non-digits, not all identical, both mod-11 check digits match.
[[nodiscard]] bool is_valid_cpf(std::string_view value);

// 14 digits after stripping non-digits, not all identical, both mod-11 check digits match.
[[nodiscard]] bool is_valid_cnpj(std::string_view value);

// Exactly 8 digits after stripping non-digits.
[[nodiscard]] bool is_valid_cep(std::string_view value);

// 10 or 11 digits after stripping non-digits.
[[nodiscard]] bool is_valid_phone(std::string_view value);

// Hyphens and whitespace are stripped; 10 characters -> ISBN-10, 13 -> ISBN-13.
[[nodiscard]] bool is_valid_isbn(std::string_view value);
// Expect already-stripped input.
[[nodiscard]] bool is_valid_isbn10(std::string_view isbn);
[[nodiscard]] bool is_valid_isbn13(std::string_view isbn);

// 8-4-4-4-12 hex, version nibble 1-5, variant nibble 8, 9, a or b (case-insensitive).
[[nodiscard]] bool is_valid_uuid(std::string_view value);

// True iff forgiving-decode then standard encode reproduces the input exactly.
// Consequences: padding is mandatory, whitespace and the URL-safe alphabet are
// rejected, and non-zero trailing bits are rejected.
[[nodiscard]] bool is_valid_base64(std::string_view value);

// Length (in code points) >= min_length, and at least one A-Z, a-z, 0-9 and symbol.
[[nodiscard]] bool is_strong_password(std::string_view value,
                                      std::size_t min_length = kDefaultPasswordLength);

// ── Numeric coercion ────────────────────────────────────────────────────────

// Text to number with the usual loose rules: surrounding whitespace ignored, empty
// text is 0, optional sign, decimal with optional exponent, "Infinity", and unsigned
// 0x / 0o / 0b literals. Anything else is nullopt.
[[nodiscard]] std::optional<double> parse_number_text(std::string_view text);

// Numbers pass through, booleans are 1/0, strings go through parse_number_text,
// null is 0. Arrays and objects are not numbers.
[[nodiscard]] std::optional<double> to_number(const nlohmann::json& value);

// ── Kind-level checkers ─────────────────────────────────────────────────────
// One overload per RuleKind alternative. check_kind() dispatches with std::visit,
// so a kind without an overload does not compile.

[[nodiscard]] bool check(const kinds::String& kind, const nlohmann::json& value,
                         const Bounds& bounds);
[[nodiscard]] bool check(const kinds::Number& kind, const nlohmann::json& value,
                         const Bounds& bounds);
[[nodiscard]] bool check(const kinds::Boolean& kind, const nlohmann::json& value,
                         const Bounds& bounds);
[[nodiscard]] bool check(const kinds::Email& kind, const nlohmann::json& value,
                         const Bounds& bounds);
[[nodiscard]] bool check(const kinds::Url& kind, const nlohmann::json& value,
                         const Bounds& bounds);
[[nodiscard]] bool check(const kinds::Date& kind, const nlohmann::json& value,
                         const Bounds& bounds);
[[nodiscard]] bool check(const kinds::Cpf& kind, const nlohmann::json& value,
                         const Bounds& bounds);
[[nodiscard]] bool check(const kinds::Cnpj& kind, const nlohmann::json& value,
                         const Bounds& bounds);
[[nodiscard]] bool check(const kinds::Cep& kind, const nlohmann::json& value,
                         const Bounds& bounds);
[[nodiscard]] bool check(const kinds::Phone& kind, const nlohmann::json& value,
                         const Bounds& bounds);
[[nodiscard]] bool check(const kinds::Isbn& kind, const nlohmann::json& value,
                         const Bounds& bounds);
[[nodiscard]] bool check(const kinds::Uuid& kind, const nlohmann::json& value,
                         const Bounds& bounds);
[[nodiscard]] bool check(const kinds::Json& kind, const nlohmann::json& value,
                         const Bounds& bounds);
[[nodiscard]] bool check(const kinds::Base64& kind, const nlohmann::json& value,
                         const Bounds& bounds);
[[nodiscard]] bool check(const kinds::Password& kind, const nlohmann::json& value,
                         const Bounds& bounds);

[[nodiscard]] bool check_kind(const RuleKind& kind, const nlohmann::json& value,
                              const Bounds& bounds);

}  // namespace fguard::validation
