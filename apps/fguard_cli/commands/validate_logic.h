#pragma once

#include "fguard/core/clock.h"
#include "fguard/schema/schema.h"

#include <nlohmann/json.hpp>

#include <string>

struct ValidateFlags {
  bool sanitize{false};  // NOLINT(readability-identifier-naming)
  bool update{false};    // NOLINT(readability-identifier-naming)
  bool strict{false};    // NOLINT(readability-identifier-naming)
  // Input is {"body", "query", "params"} rather than one flat record.
  bool request{false};  // NOLINT(readability-identifier-naming)
};

struct CommandOutcome {
  int exit_code{0};       // NOLINT(readability-identifier-naming)
  nlohmann::json output;  // NOLINT(readability-identifier-naming)
  std::string error;      // NOLINT(readability-identifier-naming)
};

// execute_validate runs one record through `schema`.
// Output is the ValidationResult document, or the serialized ValidationFailed when
// flags.strict is set and the record is invalid. Takes only library types so it can
// be exercised without the command-line layer.
CommandOutcome execute_validate(const nlohmann::json& input, const fguard::schema::Schema& schema,
                                const ValidateFlags& flags, fguard::core::IClock& clock);
