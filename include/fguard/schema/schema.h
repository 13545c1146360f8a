#pragma once

#include "fguard/validation/validation_result.h"
#include "fguard/validation/validation_rule.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fguard::schema {

struct FieldSpec {
  std::string field;
  validation::FieldRules rules;
};

// Cross-field check over the whole input mapping. Returns the error to report,
// or nullopt when the record satisfies the invariant.
using RecordCheck =
    std::function<std::optional<validation::ValidationErrorItem>(const nlohmann::json& data)>;

// Schema is plain data: an ordered list of field specs plus record-level checks
// evaluated after every field. Built once, read-only afterwards.
struct Schema {
  std::string name;
  std::vector<FieldSpec> fields;
  std::vector<RecordCheck> record_checks;

  [[nodiscard]] const FieldSpec* find(std::string_view field) const;
};

// Update variant for a partial payload: only fields present in `payload` are kept,
// each rule with required = false. Record checks carry over unchanged.
[[nodiscard]] Schema derive_update_schema(const Schema& base, const nlohmann::json& payload);

}  // namespace fguard::schema
