#include "fguard/schema/schema_registry.h"

#include "fguard/core/clock.h"
#include "fguard/schema/presets.h"
#include "fguard/schema/schema_json.h"
#include "fguard/validation/validator.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using fguard::core::FixedClock;
using fguard::schema::Schema;
using fguard::schema::SchemaRegistry;
using fguard::validation::ErrorCode;
using json = nlohmann::json;

// ── Registry ────────────────────────────────────────────────────────────────

TEST_CASE("Default registry holds every preset", "[schema][registry]") {
  FixedClock clock("2026-01-01T00:00:00Z");
  const auto registry = fguard::schema::make_default_registry(clock);

  REQUIRE(registry.size() == 6);
  CHECK(registry.names() == std::vector<std::string>{"address", "book", "date_range", "id_param",
                                                      "pagination", "user"});
  REQUIRE(registry.find("book") != nullptr);
  CHECK(registry.find("book")->fields.size() == 5);
  CHECK(registry.find("missing") == nullptr);
}

TEST_CASE("Registry rejects empty and duplicate names", "[schema][registry]") {
  SchemaRegistry registry;
  registry.add(Schema{.name = "a"});
  CHECK_THROWS_AS(registry.add(Schema{.name = "a"}), std::invalid_argument);
  CHECK_THROWS_AS(registry.add(Schema{}), std::invalid_argument);
  CHECK(registry.size() == 1);
}

// ── JSON rule descriptions ──────────────────────────────────────────────────

TEST_CASE("rule_from_json builds a rule from its description", "[schema][json]") {
  const auto rule = fguard::schema::rule_from_json(
      json{{"type", "string"}, {"required", true}, {"min", 2}, {"pattern", "^[a-z]+$"},
           {"enum", {"ab", "cd"}}, {"transform", "lower_trim"}, {"message", "bad code"}});
  REQUIRE(rule.has_value());
  CHECK(rule.value().required);
  CHECK(rule.value().min == 2.0);
  CHECK_FALSE(rule.value().max.has_value());
  REQUIRE(rule.value().pattern.has_value());
  CHECK(rule.value().pattern->source == "^[a-z]+$");
  CHECK(rule.value().allowed_values->size() == 2);
  CHECK(static_cast<bool>(rule.value().transform));
  CHECK(rule.value().message == "bad code");

  CHECK(fguard::validation::validate_value("  AB ", rule.value()));
  CHECK_FALSE(fguard::validation::validate_value("ef", rule.value()));
}

TEST_CASE("rule_from_json reports malformed descriptions", "[schema][json]") {
  CHECK_FALSE(fguard::schema::rule_from_json(json{{"type", "color"}}).has_value());
  CHECK_FALSE(fguard::schema::rule_from_json(json{{"required", true}}).has_value());
  CHECK_FALSE(fguard::schema::rule_from_json(json{{"type", "cpf"}, {"requried", true}})
                  .has_value());
  CHECK_FALSE(fguard::schema::rule_from_json(json{{"type", "string"}, {"pattern", "(["}})
                  .has_value());
  CHECK_FALSE(fguard::schema::rule_from_json(json{{"type", "number"}, {"min", "1"}}).has_value());
  CHECK_FALSE(fguard::schema::rule_from_json(json{{"type", "string"}, {"transform", "rot13"}})
                  .has_value());
  CHECK_FALSE(fguard::schema::rule_from_json(json::array()).has_value());

  const auto unknown = fguard::schema::rule_from_json(json{{"type", "cpf"}, {"requried", true}});
  CHECK(unknown.error() == "unknown rule option 'requried'");
}

TEST_CASE("schemas_from_json loads named schemas with rule lists", "[schema][json]") {
  const json document = json::parse(R"({
    "customer": {
      "document": [
        {"type": "string", "required": true, "transform": "digits_only"},
        {"type": "cpf"}
      ],
      "zip": {"type": "cep"}
    }
  })");

  const auto loaded = fguard::schema::schemas_from_json(document);
  REQUIRE(loaded.has_value());
  REQUIRE(loaded.value().size() == 1);

  const Schema& customer = loaded.value()[0];
  CHECK(customer.name == "customer");
  REQUIRE(customer.fields.size() == 2);
  CHECK(customer.fields[0].field == "document");
  CHECK(customer.fields[0].rules.size() == 2);

  const auto result = fguard::validation::validate_object(
      json{{"document", "529.982.247-25"}, {"zip", "0131-100"}}, customer);
  REQUIRE(result.errors.size() == 1);
  CHECK(result.errors[0].code == ErrorCode::kInvalidCep);
  CHECK(result.sanitized_data.at("document") == "52998224725");
}

TEST_CASE("schemas_from_json names the schema and field of a bad rule", "[schema][json]") {
  const auto loaded = fguard::schema::schemas_from_json(
      json{{"customer", {{"zip", {{"type", "zipcode"}}}}}});
  REQUIRE_FALSE(loaded.has_value());
  CHECK(loaded.error() == "schema 'customer': field 'zip': unknown rule type 'zipcode'");

  CHECK_FALSE(fguard::schema::schemas_from_json(json{{"empty", {{"f", json::array()}}}})
                  .has_value());
  CHECK_FALSE(fguard::schema::schemas_from_json(json::array()).has_value());
}

TEST_CASE("schema_to_json describes fields in schema order", "[schema][json]") {
  FixedClock clock("2026-01-01T00:00:00Z");
  const json described = fguard::schema::schema_to_json(fguard::schema::make_book_schema(clock));

  CHECK(described.at("name") == "book");
  CHECK(described.at("record_checks") == 0);
  REQUIRE(described.at("fields").size() == 5);
  CHECK(described.at("fields")[0].at("field") == "title");
  CHECK(described.at("fields")[4].at("field") == "available");

  const json& year_rule = described.at("fields")[3].at("rules")[0];
  CHECK(year_rule.at("type") == "number");
  CHECK(year_rule.at("max") == 2026.0);

  const json& available_rule = described.at("fields")[4].at("rules")[0];
  CHECK(available_rule.at("default") == true);
  CHECK(available_rule.at("required") == false);
}
