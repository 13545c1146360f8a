#pragma once

#include "fguard/schema/schema.h"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fguard::core {
class IClock;
}  // namespace fguard::core

namespace fguard::schema {

// SchemaRegistry maps names to schemas. Populated at startup, read-only afterwards;
// concurrent lookups need no locking once construction is done.
class SchemaRegistry {
 public:
  // Throws std::invalid_argument for an empty or already registered name.
  void add(Schema schema);

  // Returns nullptr if no schema has this name.
  [[nodiscard]] const Schema* find(std::string_view name) const;

  // Registered names in lexicographic order.
  [[nodiscard]] std::vector<std::string> names() const;

  [[nodiscard]] std::size_t size() const { return schemas_.size(); }

 private:
  std::map<std::string, Schema, std::less<>> schemas_;
};

// book, user, address, pagination, id_param, date_range.
[[nodiscard]] SchemaRegistry make_default_registry(core::IClock& clock);

}  // namespace fguard::schema
