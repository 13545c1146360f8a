#include "fguard/schema/schema.h"

#include <algorithm>
#include <utility>

namespace fguard::schema {

const FieldSpec* Schema::find(std::string_view field) const {
  const auto it = std::find_if(fields.begin(), fields.end(),
                               [field](const FieldSpec& spec) { return spec.field == field; });
  return it == fields.end() ? nullptr : &*it;
}

Schema derive_update_schema(const Schema& base, const nlohmann::json& payload) {
  Schema update;
  update.name = base.name + ".update";
  update.record_checks = base.record_checks;

  if (!payload.is_object()) {
    return update;
  }

  for (const auto& spec : base.fields) {
    if (!payload.contains(spec.field)) {
      continue;
    }
    FieldSpec relaxed = spec;
    for (auto& rule : relaxed.rules) {
      rule.required = false;
    }
    update.fields.push_back(std::move(relaxed));
  }
  return update;
}

}  // namespace fguard::schema
