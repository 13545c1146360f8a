#include "fguard/validation/transforms.h"

#include "fguard/core/normalization.h"
#include "fguard/sanitize/sanitizer.h"

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace fguard::validation::transforms {

using json = nlohmann::json;

namespace {

template <typename Fn>
json map_string(const json& value, Fn&& fn) {
  if (!value.is_string()) {
    return value;
  }
  return fn(std::string_view(value.get_ref<const json::string_t&>()));
}

int hex_value(char ch) {
  if (core::is_ascii_digit(ch)) {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

// Leading integer of `text`, ignoring leading whitespace. Digits stop at the first
// non-digit; a "0x" prefix switches to base 16. Empty when no digit is present or
// the digits do not fit a long long.
std::optional<long long> leading_integer(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size() && core::is_ascii_space(text[i])) {
    ++i;
  }

  long long sign = 1;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    sign = text[i] == '-' ? -1 : 1;
    ++i;
  }

  int radix = 10;
  if (i + 1 < text.size() && text[i] == '0' && (text[i + 1] == 'x' || text[i + 1] == 'X')) {
    radix = 16;
    i += 2;
  }

  const std::size_t start = i;
  long long value = 0;
  while (i < text.size()) {
    const int digit = hex_value(text[i]);
    if (digit < 0 || digit >= radix) {
      break;
    }
    if (value > (std::numeric_limits<long long>::max() - digit) / radix) {
      return std::nullopt;
    }
    value = value * radix + digit;
    ++i;
  }
  if (i == start) {
    return std::nullopt;
  }
  return sign * value;
}

}  // namespace

json digits_only(const json& value) {
  return map_string(value, [](std::string_view text) { return core::strip_non_digits(text); });
}

json strip_isbn(const json& value) {
  return map_string(value, [](std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char ch : text) {
      if (ch != '-' && !core::is_ascii_space(ch)) {
        out.push_back(ch);
      }
    }
    return out;
  });
}

json format_isbn(const json& value) {
  if (!value.is_string()) {
    return value;
  }
  const std::string clean = strip_isbn(value).get<std::string>();
  if (clean.size() == 10) {
    return clean.substr(0, 1) + "-" + clean.substr(1, 3) + "-" + clean.substr(4, 5) + "-" +
           clean.substr(9);
  }
  if (clean.size() == 13) {
    return clean.substr(0, 3) + "-" + clean.substr(3, 1) + "-" + clean.substr(4, 2) + "-" +
           clean.substr(6, 6) + "-" + clean.substr(12);
  }
  return value;
}

json lower_trim(const json& value) {
  return map_string(value, [](std::string_view text) {
    return core::trim(core::normalize_ascii_lower(text));
  });
}

json to_upper(const json& value) {
  return map_string(value, [](std::string_view text) { return core::to_ascii_upper(text); });
}

json sanitize_text(const json& value) {
  return map_string(value, [](std::string_view text) { return sanitize::sanitize_string(text); });
}

Transform int_or(long long fallback) {
  return [fallback](const json& value) -> json {
    std::optional<long long> parsed;
    if (value.is_number_unsigned()) {
      const auto number = value.get<unsigned long long>();
      if (number <= static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        parsed = static_cast<long long>(number);
      }
    } else if (value.is_number_integer()) {
      parsed = value.get<long long>();
    } else if (value.is_number_float()) {
      const double number = value.get<double>();
      if (std::isfinite(number) && std::fabs(number) < 9.0e18) {
        parsed = static_cast<long long>(std::trunc(number));
      }
    } else if (value.is_string()) {
      parsed = leading_integer(value.get_ref<const json::string_t&>());
    }

    if (!parsed.has_value() || parsed.value() == 0) {
      return fallback;
    }
    return parsed.value();
  };
}

}  // namespace fguard::validation::transforms
