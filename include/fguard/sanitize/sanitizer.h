#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace fguard::sanitize {

/// Strip markup and normalize whitespace in one string:
///   1. remove every "<...>" span
///   2. trim leading/trailing whitespace
///   3. collapse interior whitespace runs to a single space
/// Idempotent: sanitize_string(sanitize_string(s)) == sanitize_string(s).
[[nodiscard]] std::string sanitize_string(std::string_view text);

/// Recursive walk: arrays element-wise, objects value-wise (keys untouched), strings
/// through sanitize_string(), every other value unchanged.
[[nodiscard]] nlohmann::json sanitize(const nlohmann::json& value);

}  // namespace fguard::sanitize
