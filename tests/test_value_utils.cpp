#include "fguard/validation/value_utils.h"

#include "fguard/core/clock.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace fguard::validation;
using fguard::core::FixedClock;
using json = nlohmann::json;

TEST_CASE("Date predicates read now from the injected clock", "[value_utils][date]") {
  FixedClock clock("2026-06-15T12:00:00Z");

  SECTION("is_adult counts completed years") {
    CHECK(is_adult("2008-06-15", 18, clock));
    CHECK_FALSE(is_adult("2008-06-16", 18, clock));
    CHECK(is_adult("1990-01-01", 18, clock));
    CHECK_FALSE(is_adult("not a date", 18, clock));
  }

  SECTION("future and past relative to the clock") {
    CHECK(is_future_date("2027-01-01", clock));
    CHECK_FALSE(is_future_date("2020-01-01", clock));
    CHECK(is_past_date("2020-01-01", clock));
    CHECK(is_past_date(json(0), clock));
    CHECK_FALSE(is_past_date("nope", clock));
    CHECK_FALSE(is_future_date("nope", clock));
  }

  SECTION("loan availability depends on the scheduled return date") {
    CHECK(is_available_for_loan(true, nullptr, clock));
    CHECK_FALSE(is_available_for_loan(false, nullptr, clock));
    CHECK(is_available_for_loan(true, "2026-06-01", clock));
    CHECK_FALSE(is_available_for_loan(true, "2026-07-01", clock));
  }
}

TEST_CASE("date_to_unix_millis accepts text and epoch milliseconds", "[value_utils][date]") {
  CHECK(date_to_unix_millis("1970-01-02") == 86'400'000LL);
  CHECK(date_to_unix_millis(1700000000000LL) == 1700000000000LL);
  CHECK_FALSE(date_to_unix_millis(true).has_value());
  CHECK_FALSE(date_to_unix_millis("2023-02-29").has_value());
}

TEST_CASE("Character class predicates", "[value_utils]") {
  CHECK(is_alpha("José de Alencar"));
  CHECK_FALSE(is_alpha("Jose1"));
  CHECK_FALSE(is_alpha(""));

  CHECK(is_numeric("0123"));
  CHECK_FALSE(is_numeric("12a"));
  CHECK_FALSE(is_numeric(""));

  CHECK(is_alphanumeric("Rua 7 de Setembro"));
  CHECK_FALSE(is_alphanumeric("Rua #7"));

  CHECK(is_hex_color("#FFF"));
  CHECK(is_hex_color("#a1b2c3"));
  CHECK_FALSE(is_hex_color("FFF"));
  CHECK_FALSE(is_hex_color("#ABCD"));
  CHECK_FALSE(is_hex_color("#GGG"));
}

TEST_CASE("is_empty_value", "[value_utils]") {
  CHECK(is_empty_value(nullptr));
  CHECK(is_empty_value("   "));
  CHECK(is_empty_value(json::array()));
  CHECK(is_empty_value(json::object()));
  CHECK_FALSE(is_empty_value(0));
  CHECK_FALSE(is_empty_value(false));
  CHECK_FALSE(is_empty_value("x"));
}

TEST_CASE("File predicates", "[value_utils][file]") {
  const std::vector<std::string> images{"jpg", "png"};
  CHECK(has_allowed_extension("photo.JPG", images));
  CHECK(has_allowed_extension("archive.tar.png", images));
  CHECK_FALSE(has_allowed_extension("archive.png.zip", images));
  CHECK_FALSE(has_allowed_extension("README", images));

  CHECK(file_size_within(5.0 * 1024 * 1024, 5));
  CHECK_FALSE(file_size_within(5.0 * 1024 * 1024 + 1, 5));
}
