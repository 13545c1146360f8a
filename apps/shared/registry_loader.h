#pragma once

#include "fguard/core/clock.h"
#include "fguard/core/result.h"
#include "fguard/schema/schema_json.h"
#include "fguard/schema/schema_registry.h"

#include "shared/json_input.h"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fguard::apps {

using RegistryResult = core::Result<schema::SchemaRegistry, std::string>;

// Built-in presets plus every schema defined in `schema_files`.
// A schema file may not redefine a name that is already registered.
inline RegistryResult load_registry(core::IClock& clock,
                                    const std::vector<std::string>& schema_files) {
  schema::SchemaRegistry registry = schema::make_default_registry(clock);

  for (const auto& path : schema_files) {
    auto document = read_json_input(path);
    if (!document.has_value()) {
      return RegistryResult::err(document.error());
    }
    auto schemas = schema::schemas_from_json(document.value());
    if (!schemas.has_value()) {
      return RegistryResult::err(path + ": " + schemas.error());
    }
    for (auto& schema : schemas.value()) {
      try {
        registry.add(std::move(schema));
      } catch (const std::invalid_argument& e) {
        return RegistryResult::err(path + ": " + e.what());
      }
    }
  }

  return RegistryResult::ok(std::move(registry));
}

}  // namespace fguard::apps
