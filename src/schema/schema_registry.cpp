#include "fguard/schema/schema_registry.h"

#include "fguard/schema/presets.h"

#include <stdexcept>
#include <utility>

namespace fguard::schema {

void SchemaRegistry::add(Schema schema) {
  if (schema.name.empty()) {
    throw std::invalid_argument("schema name must not be empty");
  }
  if (schemas_.count(schema.name) > 0) {
    throw std::invalid_argument("schema already registered: " + schema.name);
  }
  std::string name = schema.name;
  schemas_.emplace(std::move(name), std::move(schema));
}

const Schema* SchemaRegistry::find(std::string_view name) const {
  const auto it = schemas_.find(name);
  return it == schemas_.end() ? nullptr : &it->second;
}

std::vector<std::string> SchemaRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(schemas_.size());
  for (const auto& entry : schemas_) {
    out.push_back(entry.first);
  }
  return out;
}

SchemaRegistry make_default_registry(core::IClock& clock) {
  SchemaRegistry registry;
  registry.add(make_book_schema(clock));
  registry.add(make_user_schema());
  registry.add(make_address_schema());
  registry.add(make_pagination_schema());
  registry.add(make_id_param_schema());
  registry.add(make_date_range_schema());
  return registry;
}

}  // namespace fguard::schema
