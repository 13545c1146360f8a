#pragma once

#include "fguard/schema/schema.h"

namespace fguard::core {
class IClock;
}  // namespace fguard::core

namespace fguard::schema {

// Book record. publication_year is bounded by the clock's current year.
[[nodiscard]] Schema make_book_schema(core::IClock& clock);

[[nodiscard]] Schema make_user_schema();

[[nodiscard]] Schema make_address_schema();

// page / limit are coerced to integers with defaults 1 / 10; order is upper-cased.
[[nodiscard]] Schema make_pagination_schema();

// Path parameter "id": a positive integer.
[[nodiscard]] Schema make_id_param_schema();

// Optional start_date / end_date plus the cross-field check start_date <= end_date.
[[nodiscard]] Schema make_date_range_schema();

}  // namespace fguard::schema
