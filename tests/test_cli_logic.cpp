#include <catch2/catch_test_macros.hpp>

#include "fguard/core/clock.h"
#include "fguard/schema/presets.h"

#include <nlohmann/json.hpp>

#include "check_logic.h"
#include "exit_codes.h"
#include "validate_logic.h"

using fguard::core::FixedClock;
using json = nlohmann::json;

namespace {

json valid_book() {
  return json{{"title", "Dom Casmurro"},
              {"author", "Machado de Assis"},
              {"isbn", "9780306406157"},
              {"publication_year", 1899}};
}

}  // namespace

// ── validate ────────────────────────────────────────────────────────────────

TEST_CASE("execute_validate: valid record exits 0 with the result document", "[cli][validate]") {
  FixedClock clock("2026-01-01T00:00:00Z");
  const auto book = fguard::schema::make_book_schema(clock);

  const auto outcome = execute_validate(valid_book(), book, ValidateFlags{}, clock);
  CHECK(outcome.exit_code == kExitValid);
  CHECK(outcome.error.empty());
  CHECK(outcome.output.at("isValid") == true);
  CHECK(outcome.output.at("errors").empty());
}

TEST_CASE("execute_validate: invalid record exits 2", "[cli][validate]") {
  FixedClock clock("2026-01-01T00:00:00Z");
  const auto book = fguard::schema::make_book_schema(clock);
  json data = valid_book();
  data["publication_year"] = 2027;

  SECTION("plain result document") {
    const auto outcome = execute_validate(data, book, ValidateFlags{}, clock);
    CHECK(outcome.exit_code == kExitInvalid);
    CHECK(outcome.output.at("isValid") == false);
    CHECK(outcome.output.at("errors")[0].at("field") == "publication_year");
  }

  SECTION("strict mode emits the aggregated failure") {
    const auto outcome = execute_validate(data, book, ValidateFlags{.strict = true}, clock);
    CHECK(outcome.exit_code == kExitInvalid);
    CHECK(outcome.output.at("status") == "error");
    CHECK(outcome.output.at("statusCode") == 422);
    CHECK(outcome.output.at("timestamp") == "2026-01-01T00:00:00Z");
  }
}

TEST_CASE("execute_validate: sanitize and update flags", "[cli][validate]") {
  FixedClock clock("2026-01-01T00:00:00Z");
  const auto book = fguard::schema::make_book_schema(clock);

  json messy = valid_book();
  messy["title"] = " <b>Dom</b>  Casmurro ";
  CHECK(execute_validate(messy, book, ValidateFlags{}, clock).exit_code == kExitInvalid);
  const auto cleaned = execute_validate(messy, book, ValidateFlags{.sanitize = true}, clock);
  CHECK(cleaned.exit_code == kExitValid);
  CHECK(cleaned.output.at("sanitizedData").at("title") == "Dom Casmurro");

  const json partial{{"isbn", "0306406152"}};
  CHECK(execute_validate(partial, book, ValidateFlags{.update = true}, clock).exit_code ==
        kExitValid);
}

TEST_CASE("execute_validate: request input merges body, query and params", "[cli][validate]") {
  FixedClock clock("2026-01-01T00:00:00Z");
  const auto id_param = fguard::schema::make_id_param_schema();

  const json request{{"body", {{"id", "abc"}}}, {"params", {{"id", "12"}}}};
  const auto outcome = execute_validate(request, id_param, ValidateFlags{.request = true}, clock);
  CHECK(outcome.exit_code == kExitValid);
  CHECK(outcome.output.at("sanitizedData").at("id") == "12");

  const json bad_shape{{"query", "page=2"}};
  const auto rejected =
      execute_validate(bad_shape, id_param, ValidateFlags{.request = true}, clock);
  CHECK(rejected.exit_code == kExitError);
  CHECK(rejected.error == "query must be a JSON object");
}

TEST_CASE("execute_validate: non-object input is a usage error", "[cli][validate]") {
  FixedClock clock("2026-01-01T00:00:00Z");
  const auto outcome = execute_validate(json::array({1, 2}), fguard::schema::make_user_schema(),
                                        ValidateFlags{}, clock);
  CHECK(outcome.exit_code == kExitError);
  CHECK(outcome.error == "body must be a JSON object");
}

// ── check ───────────────────────────────────────────────────────────────────

TEST_CASE("execute_check: single value against one kind", "[cli][check]") {
  const auto valid = execute_check(CheckRequest{.kind = "cpf", .value = "529.982.247-25"});
  CHECK(valid.exit_code == kExitValid);
  CHECK(valid.output.at("valid") == true);
  CHECK(valid.output.at("kind") == "cpf");

  const auto invalid = execute_check(CheckRequest{.kind = "cnpj", .value = "11.222.333/0001-82"});
  CHECK(invalid.exit_code == kExitInvalid);
  CHECK(invalid.output.at("error").at("code") == "INVALID_CNPJ");
}

TEST_CASE("execute_check: JSON values and bounds", "[cli][check]") {
  const auto below = execute_check(
      CheckRequest{.kind = "number", .value = "12", .value_is_json = true, .min = 20});
  CHECK(below.exit_code == kExitInvalid);
  CHECK(below.output.at("value") == 12);
  CHECK(below.output.at("error").at("code") == "VALIDATION_FAILED");

  const auto strong =
      execute_check(CheckRequest{.kind = "password", .value = "Ab1!", .min = 4});
  CHECK(strong.exit_code == kExitValid);
}

TEST_CASE("execute_check: usage errors exit 1", "[cli][check]") {
  CHECK(execute_check(CheckRequest{.kind = "iban", .value = "x"}).exit_code == kExitError);
  CHECK(execute_check(CheckRequest{.kind = "json", .value = "{", .value_is_json = true})
            .exit_code == kExitError);
  CHECK(execute_check(CheckRequest{.kind = "string", .value = "x", .pattern = "(["}).exit_code ==
        kExitError);
}
