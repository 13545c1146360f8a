#pragma once

#include "fguard/validation/rule_kind.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace fguard::validation {

// Pattern pairs a compiled ECMAScript regular expression with its source text.
// Matching uses search semantics (anchor with ^...$ for whole-value matches).
// The text is matched untrimmed. Text longer than kMaxPatternInputBytes never
// matches: std::regex recurses once per consumed character.
struct Pattern {
  std::string source;
  std::regex regex;
};

inline constexpr std::size_t kMaxPatternInputBytes = 1024;

// Compile a pattern. Throws std::regex_error for an invalid expression, so a bad
// pattern is rejected when the rule is built rather than while validating.
[[nodiscard]] Pattern make_pattern(std::string source);

using Predicate = std::function<bool(const nlohmann::json& value)>;
using Transform = std::function<nlohmann::json(const nlohmann::json& value)>;

// ValidationRule is an immutable description of one check for one field.
// Build with designated initializers; every member other than `kind` is optional.
//
//   ValidationRule{.kind = kinds::Isbn{}, .required = true, .message = "bad ISBN"}
//
// Bounds: `min`/`max` are character-length bounds for kinds::String, value bounds
// for kinds::Number and `min` is the minimum length for kinds::Password (default 8).
// `allowed_values` is the closed "enum" set, compared by JSON equality.
struct ValidationRule {
  RuleKind kind{kinds::String{}};
  bool required{false};
  std::optional<double> min;
  std::optional<double> max;
  std::optional<Pattern> pattern;
  std::optional<std::vector<nlohmann::json>> allowed_values;
  Predicate custom;
  Transform transform;
  std::optional<std::string> message;
  // Written to sanitized data when the field is empty and not required.
  std::optional<nlohmann::json> default_value;
};

// A field may carry an ordered list of rules; the first failing rule wins.
using FieldRules = std::vector<ValidationRule>;

}  // namespace fguard::validation
