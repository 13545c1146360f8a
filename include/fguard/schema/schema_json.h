#pragma once

#include "fguard/core/result.h"
#include "fguard/schema/schema.h"
#include "fguard/validation/validation_rule.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace fguard::schema {

// JSON rule description:
//
//   {"type": "string", "required": true, "min": 2, "max": 200,
//    "pattern": "^[a-z]+$", "enum": ["a", "b"], "message": "...",
//    "default": <any>, "transform": "digits_only"}
//
// Only "type" is mandatory. Unknown keys are rejected so a misspelt option cannot
// silently weaken a rule. Transform names: digits_only, strip_isbn, format_isbn,
// lower_trim, to_upper, sanitize_text.
[[nodiscard]] core::Result<validation::ValidationRule, std::string> rule_from_json(
    const nlohmann::json& j);

// {"<field>": <rule> | [<rule>, ...], ...}. Fields are evaluated in key order.
[[nodiscard]] core::Result<Schema, std::string> schema_from_json(const std::string& name,
                                                                 const nlohmann::json& j);

// Schema file: {"<schema name>": {"<field>": <rule> | [<rule>, ...], ...}, ...}.
[[nodiscard]] core::Result<std::vector<Schema>, std::string> schemas_from_json(
    const nlohmann::json& document);

// Descriptive listing: {"name", "fields": [{"field", "rules": [...]}], "record_checks": N}.
// Predicates and transforms are reported as flags only.
[[nodiscard]] nlohmann::json schema_to_json(const Schema& schema);

}  // namespace fguard::schema
