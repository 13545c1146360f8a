#include "fguard/schema/presets.h"

#include "fguard/core/clock.h"
#include "fguard/validation/transforms.h"
#include "fguard/validation/type_checkers.h"
#include "fguard/validation/value_utils.h"

#include <cmath>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fguard::schema {

using json = nlohmann::json;
using validation::ErrorCode;
using validation::make_pattern;
using validation::ValidationRule;
namespace kinds = validation::kinds;
namespace transforms = validation::transforms;

namespace {

// Latin-1 letters (U+00C0..U+00FF) arrive as UTF-8 pairs C3 80..C3 BF.
constexpr const char* kTitlePattern = R"(^(?:[a-zA-Z0-9\s,.:;!?'"()_-]|\xC3[\x80-\xBF])+$)";
constexpr const char* kAuthorPattern = R"(^(?:[a-zA-Z\s.]|\xC3[\x80-\xBF])+$)";
constexpr const char* kNamePattern = R"(^(?:[a-zA-Z\s]|\xC3[\x80-\xBF])+$)";

FieldSpec field(std::string name, ValidationRule rule) {
  return FieldSpec{std::move(name), validation::FieldRules{std::move(rule)}};
}

bool is_positive_integer(const json& value) {
  const auto number = validation::to_number(value);
  return number.has_value() && std::isfinite(number.value()) && number.value() >= 1.0 &&
         std::floor(number.value()) == number.value();
}

}  // namespace

Schema make_book_schema(core::IClock& clock) {
  const int max_year = core::current_year(clock);

  Schema schema;
  schema.name = "book";
  schema.fields.push_back(field(
      "title", ValidationRule{.kind = kinds::String{},
                              .required = true,
                              .min = 2,
                              .max = 200,
                              .pattern = make_pattern(kTitlePattern),
                              .message = "title must have 2 to 200 characters and contain only "
                                         "letters, digits and basic punctuation"}));
  schema.fields.push_back(field(
      "author", ValidationRule{.kind = kinds::String{},
                               .required = true,
                               .min = 3,
                               .max = 100,
                               .pattern = make_pattern(kAuthorPattern),
                               .message = "author must have 3 to 100 characters and contain only "
                                          "letters and dots"}));
  schema.fields.push_back(field(
      "isbn", ValidationRule{.kind = kinds::Isbn{},
                             .required = true,
                             .message = "invalid ISBN. Use ISBN-10 (e.g. 85-359-0277-5) or "
                                        "ISBN-13 (e.g. 978-0-306-40615-7)"}));
  schema.fields.push_back(field(
      "publication_year",
      ValidationRule{.kind = kinds::Number{},
                     .required = true,
                     .min = 0,
                     .max = max_year,
                     .message = "publication_year must be between 0 and " +
                                std::to_string(max_year)}));
  schema.fields.push_back(
      field("available", ValidationRule{.kind = kinds::Boolean{}, .default_value = json(true)}));
  return schema;
}

Schema make_user_schema() {
  Schema schema;
  schema.name = "user";
  schema.fields.push_back(field(
      "name", ValidationRule{.kind = kinds::String{},
                             .required = true,
                             .min = 3,
                             .max = 100,
                             .pattern = make_pattern(kNamePattern),
                             .message = "name must have 3 to 100 characters and contain only "
                                        "letters"}));
  schema.fields.push_back(field("email", ValidationRule{.kind = kinds::Email{},
                                                        .required = true,
                                                        .transform = transforms::lower_trim,
                                                        .message = "invalid email"}));
  schema.fields.push_back(field(
      "password", ValidationRule{.kind = kinds::Password{},
                                 .required = true,
                                 .min = 8,
                                 .max = 100,
                                 .message = "password must have at least 8 characters, including "
                                            "upper and lower case letters, digits and symbols"}));
  schema.fields.push_back(
      field("phone", ValidationRule{.kind = kinds::Phone{},
                                    .message = "invalid phone. Use the format (00) 00000-0000"}));
  return schema;
}

Schema make_address_schema() {
  Schema schema;
  schema.name = "address";
  schema.fields.push_back(field(
      "cep", ValidationRule{.kind = kinds::Cep{},
                            .required = true,
                            .message = "invalid CEP. Use the format 00000-000"}));
  schema.fields.push_back(field(
      "street", ValidationRule{.kind = kinds::String{}, .required = true, .min = 3, .max = 200}));
  schema.fields.push_back(field(
      "number", ValidationRule{.kind = kinds::String{},
                               .required = true,
                               .pattern = make_pattern("^[0-9]+[a-zA-Z]?$"),
                               .message = "number must start with digits and may end with one "
                                          "letter"}));
  schema.fields.push_back(field(
      "city", ValidationRule{.kind = kinds::String{}, .required = true, .min = 2, .max = 100}));
  schema.fields.push_back(field(
      "state", ValidationRule{.kind = kinds::String{},
                              .required = true,
                              .pattern = make_pattern("^[A-Z]{2}$"),
                              .message = "state must be a two-letter upper-case code"}));
  return schema;
}

Schema make_pagination_schema() {
  Schema schema;
  schema.name = "pagination";
  schema.fields.push_back(field("page", ValidationRule{.kind = kinds::Number{},
                                                       .min = 1,
                                                       .transform = transforms::int_or(1),
                                                       .default_value = json(1)}));
  schema.fields.push_back(field("limit", ValidationRule{.kind = kinds::Number{},
                                                        .min = 1,
                                                        .max = 100,
                                                        .transform = transforms::int_or(10),
                                                        .default_value = json(10)}));
  schema.fields.push_back(field(
      "sort_by",
      ValidationRule{.kind = kinds::String{},
                     .allowed_values = std::vector<json>{"title", "author", "publication_year",
                                                         "created_at"}}));
  schema.fields.push_back(
      field("order", ValidationRule{.kind = kinds::String{},
                                    .allowed_values = std::vector<json>{"ASC", "DESC", "asc",
                                                                        "desc"},
                                    .transform = transforms::to_upper}));
  return schema;
}

Schema make_id_param_schema() {
  Schema schema;
  schema.name = "id_param";
  schema.fields.push_back(field("id", ValidationRule{.kind = kinds::Number{},
                                                     .required = true,
                                                     .min = 1,
                                                     .custom = is_positive_integer,
                                                     .message = "id must be a positive integer"}));
  return schema;
}

Schema make_date_range_schema() {
  Schema schema;
  schema.name = "date_range";
  schema.fields.push_back(field("start_date", ValidationRule{.kind = kinds::Date{}}));
  schema.fields.push_back(field("end_date", ValidationRule{.kind = kinds::Date{}}));

  // Only ordered when both ends are present and parse; each end is checked above.
  schema.record_checks.push_back(
      [](const json& data) -> std::optional<validation::ValidationErrorItem> {
        const json start = data.value("start_date", json(nullptr));
        const json end = data.value("end_date", json(nullptr));
        const auto start_millis = validation::date_to_unix_millis(start);
        const auto end_millis = validation::date_to_unix_millis(end);
        if (!start_millis.has_value() || !end_millis.has_value()) {
          return std::nullopt;
        }
        if (start_millis.value() <= end_millis.value()) {
          return std::nullopt;
        }
        return validation::ValidationErrorItem{"end_date",
                                               "end_date must not be before start_date", end,
                                               ErrorCode::kCustomValidationFailed};
      });
  return schema;
}

}  // namespace fguard::schema
