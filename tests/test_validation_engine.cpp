#include "fguard/validation/validator.h"

#include "fguard/core/clock.h"
#include "fguard/schema/schema.h"
#include "fguard/validation/transforms.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

using fguard::validation::ErrorCode;
using fguard::validation::FieldRules;
using fguard::validation::ValidationErrorItem;
using fguard::validation::ValidationFailed;
using fguard::validation::ValidationRule;
using fguard::validation::Validator;
using json = nlohmann::json;
namespace kinds = fguard::validation::kinds;

TEST_CASE("Validator rejects non-object input", "[validation]") {
  CHECK_THROWS_AS(Validator(json::array()), std::invalid_argument);
  CHECK_THROWS_AS(Validator(json("text")), std::invalid_argument);
  CHECK_NOTHROW(Validator(json::object()));
}

TEST_CASE("Required field handling", "[validation]") {
  SECTION("absent required field reports REQUIRED once and runs nothing else") {
    int custom_calls = 0;
    const ValidationRule rule{
        .kind = kinds::String{},
        .required = true,
        .custom = [&custom_calls](const json&) {
          ++custom_calls;
          return true;
        }};

    Validator validator(json::object());
    validator.validate_field("title", rule);
    const auto result = validator.result();

    REQUIRE_FALSE(result.is_valid);
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].field == "title");
    CHECK(result.errors[0].code == ErrorCode::kRequired);
    CHECK(result.errors[0].message == "title is required");
    CHECK(custom_calls == 0);
  }

  SECTION("null and empty string count as absent") {
    const ValidationRule rule{.required = true};
    Validator validator(json{{"a", nullptr}, {"b", ""}});
    validator.validate_field("a", rule).validate_field("b", rule);
    const auto result = validator.result();
    REQUIRE(result.errors.size() == 2);
    CHECK(result.errors[0].code == ErrorCode::kRequired);
    CHECK(result.errors[1].code == ErrorCode::kRequired);
  }

  SECTION("optional empty field passes and receives its default") {
    const ValidationRule rule{.kind = kinds::Boolean{}, .default_value = json(true)};
    Validator validator(json::object());
    validator.validate_field("available", rule);
    const auto result = validator.result();
    CHECK(result.is_valid);
    CHECK(result.sanitized_data.at("available") == true);
  }

  SECTION("optional empty field without default is left untouched") {
    Validator validator(json{{"note", ""}});
    validator.validate_field("note", ValidationRule{.kind = kinds::Email{}});
    const auto result = validator.result();
    CHECK(result.is_valid);
    CHECK(result.sanitized_data.at("note") == "");
  }
}

TEST_CASE("Rule steps run in a fixed order and the first failure wins", "[validation]") {
  SECTION("kind failure is reported before the custom predicate") {
    const ValidationRule rule{.kind = kinds::Number{},
                              .custom = [](const json&) { return false; }};
    Validator validator(json{{"age", "abc"}});
    const auto result = validator.validate_field("age", rule).result();
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].code == ErrorCode::kValidationFailed);
    CHECK(result.errors[0].message == "age must be a valid number");
  }

  SECTION("custom predicate runs once the kind passes") {
    const ValidationRule rule{.kind = kinds::Number{},
                              .custom = [](const json& v) { return v.get<double>() > 10; }};
    Validator validator(json{{"age", 5}});
    const auto result = validator.validate_field("age", rule).result();
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].code == ErrorCode::kCustomValidationFailed);
    CHECK(result.errors[0].message == "age failed custom validation");
  }

  SECTION("enum membership uses JSON equality") {
    const ValidationRule rule{.allowed_values = std::vector<json>{"ASC", "DESC"}};
    Validator validator(json{{"order", "up"}});
    const auto result = validator.validate_field("order", rule).result();
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].code == ErrorCode::kInvalidEnumValue);
    CHECK(result.errors[0].message == "order must be one of: ASC, DESC");
  }

  SECTION("custom predicate is reported when enum would also fail") {
    const ValidationRule rule{.allowed_values = std::vector<json>{"ASC", "DESC"},
                              .custom = [](const json&) { return false; }};
    Validator validator(json{{"order", "up"}});
    const auto result = validator.validate_field("order", rule).result();
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].code == ErrorCode::kCustomValidationFailed);
    CHECK(result.errors[0].message == "order failed custom validation");
  }

  SECTION("enum is reported when the pattern would also fail") {
    const ValidationRule rule{.pattern = fguard::validation::make_pattern("^[A-Z]+$"),
                              .allowed_values = std::vector<json>{"ASC", "DESC"}};
    Validator validator(json{{"order", "up"}});
    const auto result = validator.validate_field("order", rule).result();
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].code == ErrorCode::kInvalidEnumValue);
    CHECK(result.errors[0].message == "order must be one of: ASC, DESC");
  }

  SECTION("pattern uses search semantics") {
    const ValidationRule unanchored{.pattern = fguard::validation::make_pattern("[0-9]")};
    const ValidationRule anchored{.pattern = fguard::validation::make_pattern("^[0-9]+$")};
    Validator validator(json{{"code", "ab1"}});
    const auto result =
        validator.validate_field("code", unanchored).validate_field("code", anchored).result();
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].code == ErrorCode::kPatternMismatch);
    CHECK(result.errors[0].message == "code has an invalid format");
  }

  SECTION("rule message overrides every default message") {
    const ValidationRule rule{.kind = kinds::Cpf{}, .required = true, .message = "bad CPF"};
    Validator validator(json{{"other", 1}, {"cpf", "123"}});
    const auto result =
        validator.validate_field("missing", rule).validate_field("cpf", rule).result();
    REQUIRE(result.errors.size() == 2);
    CHECK(result.errors[0].message == "bad CPF");
    CHECK(result.errors[0].code == ErrorCode::kRequired);
    CHECK(result.errors[1].message == "bad CPF");
    CHECK(result.errors[1].code == ErrorCode::kInvalidCpf);
  }
}

TEST_CASE("A rule list stops at the first failing rule", "[validation]") {
  int second_rule_calls = 0;
  const FieldRules rules{
      ValidationRule{.kind = kinds::Email{}},
      ValidationRule{.custom = [&second_rule_calls](const json&) {
        ++second_rule_calls;
        return true;
      }}};

  Validator validator(json{{"email", "not-an-email"}});
  const auto result = validator.validate_field("email", rules).result();
  REQUIRE(result.errors.size() == 1);
  CHECK(result.errors[0].code == ErrorCode::kInvalidEmail);
  CHECK(second_rule_calls == 0);
}

TEST_CASE("Rules in a list see the value produced by earlier transforms", "[validation]") {
  const FieldRules rules{
      ValidationRule{.transform = fguard::validation::transforms::digits_only},
      ValidationRule{.pattern = fguard::validation::make_pattern("^[0-9]{11}$")}};
  Validator validator(json{{"cpf", "529.982.247-25"}});
  const auto result = validator.validate_field("cpf", rules).result();
  CHECK(result.is_valid);
  CHECK(result.sanitized_data.at("cpf") == "52998224725");
}

TEST_CASE("Transforms are recorded in sanitized data even when validation fails",
          "[validation]") {
  const ValidationRule rule{.kind = kinds::Cpf{},
                            .transform = fguard::validation::transforms::digits_only};
  Validator validator(json{{"cpf", "529.982.247-26"}});
  const auto result = validator.validate_field("cpf", rule).result();
  REQUIRE_FALSE(result.is_valid);
  CHECK(result.errors[0].code == ErrorCode::kInvalidCpf);
  CHECK(result.errors[0].value == "52998224726");
  CHECK(result.sanitized_data.at("cpf") == "52998224726");
}

TEST_CASE("Fields without rules pass through sanitized data unchanged", "[validation]") {
  Validator validator(json{{"title", "Dune"}, {"extra", json{{"nested", 1}}}});
  const auto result = validator.validate_field("title", ValidationRule{}).result();
  CHECK(result.is_valid);
  CHECK(result.sanitized_data.at("extra") == json{{"nested", 1}});
}

TEST_CASE("Throwing callbacks become validation errors", "[validation]") {
  SECTION("throwing custom predicate fails only its own field") {
    const ValidationRule throwing{.custom = [](const json&) -> bool {
      throw std::runtime_error("lookup unavailable");
    }};
    Validator validator(json{{"a", "x"}, {"b", "not-an-email"}});
    const auto result = validator.validate_field("a", throwing)
                            .validate_field("b", ValidationRule{.kind = kinds::Email{}})
                            .result();
    REQUIRE(result.errors.size() == 2);
    CHECK(result.errors[0].code == ErrorCode::kCustomValidationFailed);
    CHECK(result.errors[0].message == "a failed custom validation: lookup unavailable");
    CHECK(result.errors[1].code == ErrorCode::kInvalidEmail);
  }

  SECTION("throwing transform reports VALIDATION_FAILED") {
    const ValidationRule throwing{.transform = [](const json&) -> json {
      throw std::runtime_error("boom");
    }};
    Validator validator(json{{"a", "x"}});
    const auto result = validator.validate_field("a", throwing).result();
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].code == ErrorCode::kValidationFailed);
    CHECK(result.errors[0].message == "a could not be transformed: boom");
  }

  SECTION("throwing record check reports an error with an empty field") {
    Validator validator(json{{"a", 1}});
    validator.custom([](const json&) -> std::optional<ValidationErrorItem> {
      throw std::runtime_error("bad state");
    });
    const auto result = validator.result();
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].field.empty());
    CHECK(result.errors[0].code == ErrorCode::kCustomValidationFailed);
    CHECK(result.errors[0].message == "Custom validation failed: bad state");
  }

  SECTION("callbacks throwing non-exception types do not abort later fields") {
    fguard::schema::Schema schema{
        .name = "odd_throws",
        .fields = {{"a", {ValidationRule{.custom = [](const json&) -> bool { throw 42; }}}},
                   {"b", {ValidationRule{.transform = [](const json&) -> json {
                            throw std::string("not an exception");
                          }}}},
                   {"c", {ValidationRule{.kind = kinds::Email{}}}}},
        .record_checks = {[](const json&) -> std::optional<ValidationErrorItem> { throw 7; }}};

    Validator validator(json{{"a", "x"}, {"b", "y"}, {"c", "not-an-email"}});
    const auto result = validator.validate_fields(schema).result();

    REQUIRE(result.errors.size() == 4);
    CHECK(result.errors[0].field == "a");
    CHECK(result.errors[0].code == ErrorCode::kCustomValidationFailed);
    CHECK(result.errors[0].message == "a failed custom validation: unknown error");
    CHECK(result.errors[1].field == "b");
    CHECK(result.errors[1].code == ErrorCode::kValidationFailed);
    CHECK(result.errors[1].message == "b could not be transformed: unknown error");
    CHECK(result.errors[2].field == "c");
    CHECK(result.errors[2].code == ErrorCode::kInvalidEmail);
    CHECK(result.errors[3].field.empty());
    CHECK(result.errors[3].code == ErrorCode::kCustomValidationFailed);
    CHECK(result.errors[3].message == "Custom validation failed: unknown error");
  }
}

TEST_CASE("validate_fields runs record checks after every field", "[validation]") {
  fguard::schema::Schema schema{
      .name = "pair",
      .fields = {{"a", {ValidationRule{.kind = kinds::Number{}, .required = true}}}},
      .record_checks = {[](const json& data) -> std::optional<ValidationErrorItem> {
        if (data.contains("b")) {
          return std::nullopt;
        }
        return ValidationErrorItem{"b", "b is needed alongside a", nullptr,
                                   ErrorCode::kCustomValidationFailed};
      }}};

  const auto result = fguard::validation::validate_object(json{{"a", "x"}}, schema);
  REQUIRE(result.errors.size() == 2);
  CHECK(result.errors[0].field == "a");
  CHECK(result.errors[1].field == "b");
  CHECK(result.is_valid == result.errors.empty());
}

TEST_CASE("throw_if_invalid raises an aggregated 422 failure", "[validation]") {
  Validator validator(json::object());
  validator.validate_field("a", ValidationRule{.required = true})
      .validate_field("b", ValidationRule{.required = true});

  try {
    validator.throw_if_invalid("Invalid book");
    FAIL("expected ValidationFailed");
  } catch (const ValidationFailed& failure) {
    CHECK(std::string(failure.what()) == "Invalid book");
    CHECK(failure.status_code() == 422);
    CHECK(failure.errors().size() == 2);

    fguard::core::FixedClock clock("2026-01-01T00:00:00Z");
    const json body = fguard::validation::validation_failed_to_json(failure, clock);
    CHECK(body.at("status") == "error");
    CHECK(body.at("statusCode") == 422);
    CHECK(body.at("timestamp") == "2026-01-01T00:00:00Z");
    CHECK(body.at("errors").size() == 2);
    CHECK(body.at("errors")[0].at("code") == "REQUIRED");
  }

  Validator valid(json{{"a", 1}});
  CHECK_NOTHROW(valid.validate_field("a", ValidationRule{.kind = kinds::Number{}})
                    .throw_if_invalid());
}

TEST_CASE("validation_result_to_json uses wire keys", "[validation]") {
  Validator validator(json{{"email", "bad"}});
  const auto result = validator.validate_field("email", ValidationRule{.kind = kinds::Email{}})
                          .result();
  const json out = fguard::validation::validation_result_to_json(result);
  CHECK(out.at("isValid") == false);
  CHECK(out.at("sanitizedData").at("email") == "bad");
  REQUIRE(out.at("errors").size() == 1);
  CHECK(out.at("errors")[0].at("field") == "email");
  CHECK(out.at("errors")[0].at("code") == "INVALID_EMAIL");
  CHECK(out.at("errors")[0].at("value") == "bad");
}

TEST_CASE("validate_value checks a single value against a single rule", "[validation]") {
  CHECK(fguard::validation::validate_value("user@example.com",
                                           ValidationRule{.kind = kinds::Email{}}));
  CHECK_FALSE(fguard::validation::validate_value("user@", ValidationRule{.kind = kinds::Email{}}));
  CHECK_FALSE(fguard::validation::validate_value(nullptr, ValidationRule{.required = true}));
}
