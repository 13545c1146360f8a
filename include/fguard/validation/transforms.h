#pragma once

#include "fguard/validation/validation_rule.h"

#include <nlohmann/json.hpp>

namespace fguard::validation {

/// Ready-made ValidationRule::transform functions.
/// Non-string input passes through unchanged unless noted otherwise.
namespace transforms {

/// Keep only 0-9 ("529.982.247-25" -> "52998224725"). For CPF, CNPJ, CEP and phone.
nlohmann::json digits_only(const nlohmann::json& value);

/// Remove hyphens and whitespace from an ISBN.
nlohmann::json strip_isbn(const nlohmann::json& value);

/// Canonical hyphenation: ISBN-10 as 1-3-5-1, ISBN-13 as 3-1-2-6-1.
/// Input of any other stripped length is returned as given.
nlohmann::json format_isbn(const nlohmann::json& value);

/// ASCII lower-case and trim (e-mail addresses).
nlohmann::json lower_trim(const nlohmann::json& value);

/// ASCII upper-case.
nlohmann::json to_upper(const nlohmann::json& value);

/// Markup and whitespace cleanup via sanitize::sanitize_string().
nlohmann::json sanitize_text(const nlohmann::json& value);

/// Leading-integer parse with a fallback: "  42abc" -> 42, "0x1A" -> 26, 7.9 -> 7.
/// Zero, unparseable or out-of-range input and non-numeric values all yield `fallback`.
Transform int_or(long long fallback);

}  // namespace transforms
}  // namespace fguard::validation
