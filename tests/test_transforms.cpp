#include "fguard/validation/transforms.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

namespace transforms = fguard::validation::transforms;
using json = nlohmann::json;

TEST_CASE("digits_only keeps 0-9", "[transforms]") {
  CHECK(transforms::digits_only("529.982.247-25") == "52998224725");
  CHECK(transforms::digits_only("(11) 98765-4321") == "11987654321");
  CHECK(transforms::digits_only(12345) == 12345);
}

TEST_CASE("ISBN transforms", "[transforms][isbn]") {
  CHECK(transforms::strip_isbn("978-0-306 40615-7") == "9780306406157");
  CHECK(transforms::format_isbn("9780306406157") == "978-0-30-640615-7");
  CHECK(transforms::format_isbn("0306406152") == "0-306-40615-2");
  CHECK(transforms::format_isbn("12345") == "12345");
  CHECK(transforms::format_isbn(nullptr).is_null());
}

TEST_CASE("Case transforms", "[transforms]") {
  CHECK(transforms::lower_trim("  USER@Example.COM ") == "user@example.com");
  CHECK(transforms::to_upper("desc") == "DESC");
  CHECK(transforms::to_upper(5) == 5);
}

TEST_CASE("sanitize_text applies the sanitizer to one value", "[transforms]") {
  CHECK(transforms::sanitize_text(" <p>Rua  Augusta</p> ") == "Rua Augusta");
  CHECK(transforms::sanitize_text(json::array()) == json::array());
}

TEST_CASE("int_or parses a leading integer or falls back", "[transforms]") {
  const auto page = transforms::int_or(1);

  CHECK(page("42") == 42);
  CHECK(page("  42abc") == 42);
  CHECK(page("-5") == -5);
  CHECK(page("0x1A") == 26);
  CHECK(page(7) == 7);
  CHECK(page(7.9) == 7);

  SECTION("zero and unparseable input yield the fallback") {
    CHECK(page("0") == 1);
    CHECK(page("abc") == 1);
    CHECK(page("") == 1);
    CHECK(page(0) == 1);
    CHECK(page(true) == 1);
    CHECK(page(json::object()) == 1);
  }

  SECTION("integers that do not fit a long long yield the fallback") {
    CHECK(page("99999999999999999999") == 1);
    CHECK(page("-99999999999999999999") == 1);
    CHECK(page("0xFFFFFFFFFFFFFFFFFF") == 1);
    CHECK(page(json(18446744073709551615ULL)) == 1);
    CHECK(page("9223372036854775807") == 9223372036854775807LL);
  }
}
