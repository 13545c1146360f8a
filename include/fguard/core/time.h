#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace fguard::core {

// Largest absolute time value representable as a calendar date (+/- 100,000,000 days).
constexpr std::int64_t kMaxAbsUnixMillis = 8'640'000'000'000'000;

// CivilTime is a broken-down calendar instant.
// The calendar fields are exactly as written in the parsed text; unix_millis is the
// instant in UTC after applying any explicit offset.
struct CivilTime {
  int year{1970};
  int month{1};
  int day{1};
  int hour{0};
  int minute{0};
  int second{0};
  int millisecond{0};
  std::int64_t unix_millis{0};
};

[[nodiscard]] bool is_leap_year(int year) noexcept;
[[nodiscard]] int days_in_month(int year, int month) noexcept;

// Days since 1970-01-01 for a proleptic Gregorian date. No range validation.
[[nodiscard]] std::int64_t days_from_civil(std::int64_t year, int month, int day) noexcept;

// UTC calendar fields for a Unix millisecond value.
[[nodiscard]] CivilTime civil_from_unix_millis(std::int64_t unix_millis) noexcept;

// parse_timestamp accepts ISO 8601 calendar dates and date-times:
//   YYYY | YYYY-MM | YYYY-MM-DD | +YYYYYY-MM-DD | YYYY/MM/DD
//   followed optionally by (T|space)HH:MM[:SS[.fraction]] and Z or +HH:MM / +HHMM.
// Every field is range-checked against the calendar (2023-02-29 is rejected).
// Times without an offset are taken as UTC.
// Returns nullopt for anything else.
[[nodiscard]] std::optional<CivilTime> parse_timestamp(std::string_view text);

}  // namespace fguard::core
