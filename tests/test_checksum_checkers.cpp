#include "fguard/validation/type_checkers.h"

#include <catch2/catch_test_macros.hpp>

using namespace fguard::validation;

// ── CPF ─────────────────────────────────────────────────────────────────────

TEST_CASE("CPF with correct check digits is valid", "[checkers][cpf]") {
  CHECK(is_valid_cpf("529.982.247-25"));
  CHECK(is_valid_cpf("52998224725"));
}

TEST_CASE("CPF with a single altered digit is invalid", "[checkers][cpf]") {
  CHECK_FALSE(is_valid_cpf("529.982.247-26"));  // second check digit
  CHECK_FALSE(is_valid_cpf("529.982.247-35"));  // first check digit
  CHECK_FALSE(is_valid_cpf("529.982.248-25"));  // body digit
}

TEST_CASE("CPF of repeated digits is invalid regardless of checksum", "[checkers][cpf]") {
  CHECK_FALSE(is_valid_cpf("111.111.111-11"));
  CHECK_FALSE(is_valid_cpf("00000000000"));
}

TEST_CASE("CPF needs exactly 11 digits", "[checkers][cpf]") {
  CHECK_FALSE(is_valid_cpf("529.982.247-2"));
  CHECK_FALSE(is_valid_cpf("529.982.247-255"));
  CHECK_FALSE(is_valid_cpf(""));
}

// ── CNPJ ────────────────────────────────────────────────────────────────────

TEST_CASE("CNPJ with correct check digits is valid", "[checkers][cnpj]") {
  CHECK(is_valid_cnpj("11.222.333/0001-81"));
  CHECK(is_valid_cnpj("11222333000181"));
}

TEST_CASE("CNPJ with either check digit altered is invalid", "[checkers][cnpj]") {
  CHECK_FALSE(is_valid_cnpj("11.222.333/0001-82"));
  CHECK_FALSE(is_valid_cnpj("11.222.333/0001-91"));
}

TEST_CASE("CNPJ of repeated digits or wrong length is invalid", "[checkers][cnpj]") {
  CHECK_FALSE(is_valid_cnpj("00.000.000/0000-00"));
  CHECK_FALSE(is_valid_cnpj("11.222.333/0001-8"));
}

// ── ISBN ────────────────────────────────────────────────────────────────────

TEST_CASE("ISBN-13 checksum", "[checkers][isbn]") {
  CHECK(is_valid_isbn("9780306406157"));
  CHECK(is_valid_isbn("978-0-306-40615-7"));
  CHECK(is_valid_isbn("978 0 306 40615 7"));
  CHECK_FALSE(is_valid_isbn("9780306406158"));  // last digit incremented
  CHECK_FALSE(is_valid_isbn("9780306406156"));
}

TEST_CASE("ISBN-10 checksum", "[checkers][isbn]") {
  CHECK(is_valid_isbn("0306406152"));
  CHECK(is_valid_isbn("85-359-0277-5"));
  CHECK_FALSE(is_valid_isbn("0306406153"));
  CHECK_FALSE(is_valid_isbn("0306406162"));
}

TEST_CASE("ISBN-10 accepts X as the final check character", "[checkers][isbn]") {
  CHECK(is_valid_isbn("080442957X"));
  CHECK(is_valid_isbn("080442957x"));
  CHECK_FALSE(is_valid_isbn("X804429570"));  // X only valid in last position
}

TEST_CASE("ISBN of any other length is invalid", "[checkers][isbn]") {
  CHECK_FALSE(is_valid_isbn("030640615"));
  CHECK_FALSE(is_valid_isbn("97803064061577"));
  CHECK_FALSE(is_valid_isbn(""));
}

TEST_CASE("ISBN sub-checkers expect stripped input", "[checkers][isbn]") {
  CHECK(is_valid_isbn10("0306406152"));
  CHECK_FALSE(is_valid_isbn10("0-306-40615-2"));
  CHECK(is_valid_isbn13("9780306406157"));
  CHECK_FALSE(is_valid_isbn13("978030640615X"));
}

// ── Kind-level dispatch ─────────────────────────────────────────────────────

TEST_CASE("Checksum kinds accept only JSON strings", "[checkers]") {
  const Bounds none{};
  CHECK(check_kind(kinds::Cpf{}, "529.982.247-25", none));
  CHECK_FALSE(check_kind(kinds::Cpf{}, 52998224725LL, none));
  CHECK(check_kind(kinds::Cnpj{}, "11222333000181", none));
  CHECK(check_kind(kinds::Isbn{}, "9780306406157", none));
  CHECK_FALSE(check_kind(kinds::Isbn{}, 9780306406157LL, none));
}
