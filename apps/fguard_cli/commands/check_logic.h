#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

#include "validate_logic.h"

struct CheckRequest {
  std::string kind;                    // NOLINT(readability-identifier-naming)
  std::string value;                   // NOLINT(readability-identifier-naming)
  bool value_is_json{false};           // NOLINT(readability-identifier-naming)
  std::optional<double> min;           // NOLINT(readability-identifier-naming)
  std::optional<double> max;           // NOLINT(readability-identifier-naming)
  std::optional<std::string> pattern;  // NOLINT(readability-identifier-naming)
};

// execute_check runs one value through a single rule of the given kind.
// Output: {"kind", "value", "valid", "error"?}. Unknown kinds, unparseable JSON values
// and invalid patterns are usage errors.
CommandOutcome execute_check(const CheckRequest& request);
