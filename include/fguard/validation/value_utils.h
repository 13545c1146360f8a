#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fguard::core {
class IClock;
}  // namespace fguard::core

namespace fguard::validation {

// Stand-alone predicates for ValidationRule::custom and record checks.
// Date arguments accept ISO-8601 text or epoch milliseconds; anything else is not a
// date and makes the date predicates return false. "Now" always comes from `clock`.

// Completed years between `birth_date` and now is at least `min_age`.
[[nodiscard]] bool is_adult(const nlohmann::json& birth_date, int min_age, core::IClock& clock);

[[nodiscard]] bool is_future_date(const nlohmann::json& date, core::IClock& clock);
[[nodiscard]] bool is_past_date(const nlohmann::json& date, core::IClock& clock);

// Non-empty; ASCII letters, whitespace and Latin-1 letters (U+00C0..U+00FF) only.
[[nodiscard]] bool is_alpha(std::string_view text);
// Non-empty; 0-9 only.
[[nodiscard]] bool is_numeric(std::string_view text);
// is_alpha plus 0-9.
[[nodiscard]] bool is_alphanumeric(std::string_view text);

// "#RGB" or "#RRGGBB", case-insensitive.
[[nodiscard]] bool is_hex_color(std::string_view text);

// null, whitespace-only string, empty array or empty object.
[[nodiscard]] bool is_empty_value(const nlohmann::json& value);

// Extension after the last '.', compared case-insensitively. No '.' means no extension.
[[nodiscard]] bool has_allowed_extension(std::string_view filename,
                                         const std::vector<std::string>& allowed);

[[nodiscard]] bool file_size_within(double size_bytes, double max_megabytes);

// Available, and any scheduled return date already lies in the past.
[[nodiscard]] bool is_available_for_loan(bool available, const nlohmann::json& return_date,
                                         core::IClock& clock);

// Date value (ISO text or epoch milliseconds) to Unix milliseconds.
[[nodiscard]] std::optional<long long> date_to_unix_millis(const nlohmann::json& value);

}  // namespace fguard::validation
