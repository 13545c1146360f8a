#include "fguard/core/time.h"

#include "fguard/core/normalization.h"

#include <cstddef>

namespace fguard::core {

namespace {

bool is_digit(char ch) {
  return ch >= '0' && ch <= '9';
}

// Cursor over the timestamp text. Every reader either consumes and succeeds,
// or leaves the position untouched and fails.
class Cursor {
 public:
  explicit Cursor(std::string_view text) : text_(text) {}

  [[nodiscard]] bool done() const { return pos_ == text_.size(); }

  [[nodiscard]] char peek() const { return done() ? '\0' : text_[pos_]; }

  bool accept(char ch) {
    if (peek() == ch) {
      ++pos_;
      return true;
    }
    return false;
  }

  // Reads exactly `width` decimal digits.
  std::optional<int> fixed_digits(std::size_t width) {
    if (text_.size() - pos_ < width) {
      return std::nullopt;
    }
    int value = 0;
    for (std::size_t i = 0; i < width; ++i) {
      const char ch = text_[pos_ + i];
      if (!is_digit(ch)) {
        return std::nullopt;
      }
      value = value * 10 + (ch - '0');
    }
    pos_ += width;
    return value;
  }

  // Reads one or more digits, returning milliseconds from the leading three.
  std::optional<int> fraction_millis() {
    const std::size_t start = pos_;
    int millis = 0;
    int scale = 100;
    while (!done() && is_digit(text_[pos_])) {
      millis += (text_[pos_] - '0') * scale;
      scale /= 10;
      ++pos_;
    }
    if (pos_ == start) {
      return std::nullopt;
    }
    return millis;
  }

 private:
  std::string_view text_;
  std::size_t pos_{0};
};

struct Offset {
  int minutes{0};
};

std::optional<Offset> read_offset(Cursor& cursor) {
  if (cursor.accept('Z') || cursor.accept('z')) {
    return Offset{0};
  }
  int sign = 0;
  if (cursor.accept('+')) {
    sign = 1;
  } else if (cursor.accept('-')) {
    sign = -1;
  } else {
    return Offset{0};  // no designator: UTC
  }
  const auto hours = cursor.fixed_digits(2);
  if (!hours.has_value() || hours.value() > 23) {
    return std::nullopt;
  }
  cursor.accept(':');
  const auto minutes = cursor.fixed_digits(2);
  if (!minutes.has_value() || minutes.value() > 59) {
    return std::nullopt;
  }
  return Offset{sign * (hours.value() * 60 + minutes.value())};
}

}  // namespace

bool is_leap_year(int year) noexcept {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) noexcept {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) {
    return 0;
  }
  if (month == 2 && is_leap_year(year)) {
    return 29;
  }
  return kDays[month - 1];  // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
}

// Howard Hinnant's days_from_civil.
std::int64_t days_from_civil(std::int64_t year, int month, int day) noexcept {
  year -= month <= 2 ? 1 : 0;
  const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
  const auto yoe = static_cast<unsigned>(year - era * 400);
  const auto m = static_cast<unsigned>(month);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + static_cast<unsigned>(day) - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

CivilTime civil_from_unix_millis(std::int64_t unix_millis) noexcept {
  constexpr std::int64_t kMillisPerDay = 86'400'000;
  std::int64_t days = unix_millis / kMillisPerDay;
  std::int64_t rem = unix_millis % kMillisPerDay;
  if (rem < 0) {
    rem += kMillisPerDay;
    --days;
  }

  std::int64_t z = days + 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;

  CivilTime out;
  out.year = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
  out.month = static_cast<int>(m);
  out.day = static_cast<int>(d);
  out.hour = static_cast<int>(rem / 3'600'000);
  out.minute = static_cast<int>((rem / 60'000) % 60);
  out.second = static_cast<int>((rem / 1000) % 60);
  out.millisecond = static_cast<int>(rem % 1000);
  out.unix_millis = unix_millis;
  return out;
}

std::optional<CivilTime> parse_timestamp(std::string_view text) {
  const std::string trimmed = trim(text);
  Cursor cursor(trimmed);
  CivilTime out;

  // Year: four digits, or a signed six-digit expanded year.
  if (cursor.peek() == '+' || cursor.peek() == '-') {
    int sign = 1;
    if (cursor.accept('-')) {
      sign = -1;
    } else {
      cursor.accept('+');
    }
    const auto year = cursor.fixed_digits(6);
    if (!year.has_value() || (sign < 0 && year.value() == 0)) {
      return std::nullopt;
    }
    out.year = sign * year.value();
  } else {
    const auto year = cursor.fixed_digits(4);
    if (!year.has_value()) {
      return std::nullopt;
    }
    out.year = year.value();
  }

  // Month and day share one separator.
  bool full_date = false;
  const char separator = cursor.peek();
  if (separator == '-' || separator == '/') {
    cursor.accept(separator);
    const auto month = cursor.fixed_digits(2);
    if (!month.has_value()) {
      return std::nullopt;
    }
    out.month = month.value();
    if (cursor.accept(separator)) {
      const auto day = cursor.fixed_digits(2);
      if (!day.has_value()) {
        return std::nullopt;
      }
      out.day = day.value();
      full_date = true;
    } else if (separator == '/') {
      return std::nullopt;
    }
  }

  Offset offset;
  if (cursor.accept('T') || cursor.accept('t') || (full_date && cursor.accept(' '))) {
    const auto hour = cursor.fixed_digits(2);
    if (!hour.has_value() || !cursor.accept(':')) {
      return std::nullopt;
    }
    const auto minute = cursor.fixed_digits(2);
    if (!minute.has_value()) {
      return std::nullopt;
    }
    out.hour = hour.value();
    out.minute = minute.value();
    if (cursor.accept(':')) {
      const auto second = cursor.fixed_digits(2);
      if (!second.has_value()) {
        return std::nullopt;
      }
      out.second = second.value();
      if (cursor.accept('.') || cursor.accept(',')) {
        const auto millis = cursor.fraction_millis();
        if (!millis.has_value()) {
          return std::nullopt;
        }
        out.millisecond = millis.value();
      }
    }
    const auto parsed_offset = read_offset(cursor);
    if (!parsed_offset.has_value()) {
      return std::nullopt;
    }
    offset = parsed_offset.value();
  }

  if (!cursor.done()) {
    return std::nullopt;
  }

  // Calendar range checks. 24:00:00.000 is the end of the day.
  if (out.month < 1 || out.month > 12) {
    return std::nullopt;
  }
  if (out.day < 1 || out.day > days_in_month(out.year, out.month)) {
    return std::nullopt;
  }
  const bool end_of_day =
      out.hour == 24 && out.minute == 0 && out.second == 0 && out.millisecond == 0;
  if ((out.hour > 23 && !end_of_day) || out.minute > 59 || out.second > 59) {
    return std::nullopt;
  }

  const std::int64_t days = days_from_civil(out.year, out.month, out.day);
  const std::int64_t millis =
      (((days * 24 + out.hour) * 60 + out.minute) * 60 + out.second) * 1000 + out.millisecond -
      static_cast<std::int64_t>(offset.minutes) * 60'000;
  if (millis > kMaxAbsUnixMillis || millis < -kMaxAbsUnixMillis) {
    return std::nullopt;
  }
  out.unix_millis = millis;
  return out;
}

}  // namespace fguard::core
