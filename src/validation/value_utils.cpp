#include "fguard/validation/value_utils.h"

#include "fguard/core/clock.h"
#include "fguard/core/normalization.h"
#include "fguard/core/time.h"

#include <algorithm>
#include <cmath>

namespace fguard::validation {

using json = nlohmann::json;

namespace {

// Walks UTF-8 text accepting ASCII bytes that satisfy `ascii_ok` and the two-byte
// sequences C3 80..C3 BF (U+00C0..U+00FF).
template <typename AsciiPredicate>
bool latin_text_only(std::string_view text, AsciiPredicate ascii_ok) {
  if (text.empty()) {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto byte = static_cast<unsigned char>(text[i]);
    if (byte < 0x80U) {
      if (!ascii_ok(text[i])) {
        return false;
      }
      continue;
    }
    if (byte != 0xC3U || i + 1 >= text.size()) {
      return false;
    }
    const auto next = static_cast<unsigned char>(text[i + 1]);
    if (next < 0x80U || next > 0xBFU) {
      return false;
    }
    ++i;
  }
  return true;
}

bool is_hex_digit(char ch) {
  return core::is_ascii_digit(ch) || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
}

}  // namespace

std::optional<long long> date_to_unix_millis(const json& value) {
  if (value.is_number()) {
    const double millis = value.get<double>();
    if (!std::isfinite(millis) ||
        std::fabs(millis) > static_cast<double>(core::kMaxAbsUnixMillis)) {
      return std::nullopt;
    }
    return static_cast<long long>(millis);
  }
  if (value.is_string()) {
    const auto parsed = core::parse_timestamp(value.get_ref<const json::string_t&>());
    if (parsed.has_value()) {
      return parsed->unix_millis;
    }
  }
  return std::nullopt;
}

bool is_adult(const json& birth_date, int min_age, core::IClock& clock) {
  const auto birth_millis = date_to_unix_millis(birth_date);
  if (!birth_millis.has_value()) {
    return false;
  }
  const core::CivilTime birth = core::civil_from_unix_millis(birth_millis.value());
  const core::CivilTime today = core::civil_from_unix_millis(core::current_unix_millis(clock));

  int age = today.year - birth.year;
  if (today.month < birth.month || (today.month == birth.month && today.day < birth.day)) {
    --age;
  }
  return age >= min_age;
}

bool is_future_date(const json& date, core::IClock& clock) {
  const auto millis = date_to_unix_millis(date);
  return millis.has_value() && millis.value() > core::current_unix_millis(clock);
}

bool is_past_date(const json& date, core::IClock& clock) {
  const auto millis = date_to_unix_millis(date);
  return millis.has_value() && millis.value() < core::current_unix_millis(clock);
}

bool is_alpha(std::string_view text) {
  return latin_text_only(
      text, [](char ch) { return core::is_ascii_alpha(ch) || core::is_ascii_space(ch); });
}

bool is_numeric(std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), core::is_ascii_digit);
}

bool is_alphanumeric(std::string_view text) {
  return latin_text_only(text, [](char ch) {
    return core::is_ascii_alpha(ch) || core::is_ascii_digit(ch) || core::is_ascii_space(ch);
  });
}

bool is_hex_color(std::string_view text) {
  if (text.size() != 4 && text.size() != 7) {
    return false;
  }
  return text.front() == '#' && std::all_of(text.begin() + 1, text.end(), is_hex_digit);
}

bool is_empty_value(const json& value) {
  if (value.is_null()) {
    return true;
  }
  if (value.is_string()) {
    return core::trim(value.get_ref<const json::string_t&>()).empty();
  }
  if (value.is_array() || value.is_object()) {
    return value.empty();
  }
  return false;
}

bool has_allowed_extension(std::string_view filename, const std::vector<std::string>& allowed) {
  const std::size_t dot = filename.rfind('.');
  if (dot == std::string_view::npos) {
    return false;
  }
  const std::string extension = core::normalize_ascii_lower(filename.substr(dot + 1));
  return std::any_of(allowed.begin(), allowed.end(), [&extension](const std::string& candidate) {
    return core::normalize_ascii_lower(candidate) == extension;
  });
}

bool file_size_within(double size_bytes, double max_megabytes) {
  return size_bytes <= max_megabytes * 1024.0 * 1024.0;
}

bool is_available_for_loan(bool available, const json& return_date, core::IClock& clock) {
  if (!available) {
    return false;
  }
  if (return_date.is_null()) {
    return true;
  }
  return is_past_date(return_date, clock);
}

}  // namespace fguard::validation
