#include "fguard/validation/type_checkers.h"

#include "fguard/core/base64.h"
#include "fguard/core/normalization.h"
#include "fguard/core/time.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>

namespace fguard::validation {

using json = nlohmann::json;

namespace {

// Shared mod-11 reduction used by CPF and CNPJ: remainder < 2 -> 0, else 11 - remainder.
int mod11_check_digit(int weighted_sum) {
  const int remainder = weighted_sum % 11;
  return remainder < 2 ? 0 : 11 - remainder;
}

int digit_at(const std::string& digits, std::size_t index) {
  return digits[index] - '0';
}

bool all_same(const std::string& digits) {
  return std::all_of(digits.begin(), digits.end(),
                     [&digits](char ch) { return ch == digits.front(); });
}

bool is_hex(char ch) {
  return core::is_ascii_digit(ch) || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
}

std::string strip_isbn_separators(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    if (ch != '-' && !core::is_ascii_space(ch)) {
      out.push_back(ch);
    }
  }
  return out;
}

// Leading/trailing C0 controls and spaces are not part of a URL.
std::string_view trim_url(std::string_view value) {
  auto is_c0_or_space = [](char ch) { return static_cast<unsigned char>(ch) <= 0x20U; };
  while (!value.empty() && is_c0_or_space(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && is_c0_or_space(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

bool is_special_scheme_with_host(const std::string& scheme) {
  return scheme == "http" || scheme == "https" || scheme == "ws" || scheme == "wss" ||
         scheme == "ftp";
}

bool is_forbidden_host_char(char ch) {
  if (static_cast<unsigned char>(ch) <= 0x20U || ch == 0x7F) {
    return true;
  }
  constexpr std::string_view kForbidden = "#/:<>?@[\\]^|";
  return kForbidden.find(ch) != std::string_view::npos;
}

bool is_valid_port(std::string_view port) {
  if (port.empty()) {
    return true;
  }
  if (port.size() > 5 || !std::all_of(port.begin(), port.end(), core::is_ascii_digit)) {
    return false;
  }
  int value = 0;
  for (const char ch : port) {
    value = value * 10 + (ch - '0');
  }
  return value <= 65535;
}

bool is_valid_ipv6_literal(std::string_view host) {
  if (host.empty()) {
    return false;
  }
  return std::all_of(host.begin(), host.end(),
                     [](char ch) { return is_hex(ch) || ch == ':' || ch == '.'; }) &&
         host.find(':') != std::string_view::npos;
}

bool is_valid_authority(std::string_view rest) {
  // Any run of slashes (either direction) precedes the authority.
  std::size_t start = 0;
  while (start < rest.size() && (rest[start] == '/' || rest[start] == '\\')) {
    ++start;
  }
  rest.remove_prefix(start);

  const std::size_t end = rest.find_first_of("/?#\\");
  std::string_view authority = rest.substr(0, end);

  const std::size_t at = authority.rfind('@');
  if (at != std::string_view::npos) {
    authority.remove_prefix(at + 1);
  }

  std::string_view host;
  std::string_view port;
  if (!authority.empty() && authority.front() == '[') {
    const std::size_t close = authority.find(']');
    if (close == std::string_view::npos) {
      return false;
    }
    if (!is_valid_ipv6_literal(authority.substr(1, close - 1))) {
      return false;
    }
    const std::string_view after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        return false;
      }
      port = after.substr(1);
    }
    return is_valid_port(port);
  }

  const std::size_t colon = authority.find(':');
  host = authority.substr(0, colon);
  if (colon != std::string_view::npos) {
    port = authority.substr(colon + 1);
  }

  if (host.empty() || std::any_of(host.begin(), host.end(), is_forbidden_host_char)) {
    return false;
  }
  return is_valid_port(port);
}

std::optional<double> parse_radix_literal(std::string_view digits, int radix) {
  if (digits.empty()) {
    return std::nullopt;
  }
  double value = 0.0;
  for (const char ch : digits) {
    int d = -1;
    if (core::is_ascii_digit(ch)) {
      d = ch - '0';
    } else if (ch >= 'a' && ch <= 'f') {
      d = ch - 'a' + 10;
    } else if (ch >= 'A' && ch <= 'F') {
      d = ch - 'A' + 10;
    }
    if (d < 0 || d >= radix) {
      return std::nullopt;
    }
    value = value * radix + d;
  }
  return value;
}

// Decimal grammar: digits [. digits] [(e|E) [+|-] digits], at least one mantissa digit.
bool is_decimal_literal(std::string_view text) {
  std::size_t i = 0;
  std::size_t mantissa_digits = 0;
  while (i < text.size() && core::is_ascii_digit(text[i])) {
    ++i;
    ++mantissa_digits;
  }
  if (i < text.size() && text[i] == '.') {
    ++i;
    while (i < text.size() && core::is_ascii_digit(text[i])) {
      ++i;
      ++mantissa_digits;
    }
  }
  if (mantissa_digits == 0) {
    return false;
  }
  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
      ++i;
    }
    const std::size_t exponent_start = i;
    while (i < text.size() && core::is_ascii_digit(text[i])) {
      ++i;
    }
    if (i == exponent_start) {
      return false;
    }
  }
  return i == text.size();
}

const std::string* string_of(const json& value) {
  return value.is_string() ? value.get_ptr<const json::string_t*>() : nullptr;
}

}  // namespace

// ── Text-level checkers ─────────────────────────────────────────────────────

bool is_valid_email(std::string_view value) {
  if (value.empty() || std::any_of(value.begin(), value.end(), core::is_ascii_space)) {
    return false;
  }
  if (std::count(value.begin(), value.end(), '@') != 1) {
    return false;
  }
  if (value.find("..") != std::string_view::npos) {
    return false;
  }

  const std::size_t at = value.find('@');
  const std::string_view local = value.substr(0, at);
  const std::string_view domain = value.substr(at + 1);
  if (local.empty() || domain.size() < 3) {
    return false;
  }

  // A dot with at least one character on each side.
  const std::size_t dot = domain.find('.', 1);
  return dot != std::string_view::npos && dot + 1 < domain.size();
}

bool is_valid_url(std::string_view value) {
  const std::string_view url = trim_url(value);
  const std::size_t colon = url.find(':');
  if (colon == std::string_view::npos || colon == 0) {
    return false;
  }

  const std::string_view scheme_raw = url.substr(0, colon);
  if (!core::is_ascii_alpha(scheme_raw.front())) {
    return false;
  }
  const bool scheme_chars_ok =
      std::all_of(scheme_raw.begin(), scheme_raw.end(), [](char ch) {
        return core::is_ascii_alpha(ch) || core::is_ascii_digit(ch) || ch == '+' || ch == '-' ||
               ch == '.';
      });
  if (!scheme_chars_ok) {
    return false;
  }

  const std::string scheme = core::normalize_ascii_lower(scheme_raw);
  if (is_special_scheme_with_host(scheme)) {
    return is_valid_authority(url.substr(colon + 1));
  }
  return true;
}

bool is_valid_date(std::string_view value) {
  return core::parse_timestamp(value).has_value();
}

bool is_valid_cpf(std::string_view value) {
  const std::string cpf = core::strip_non_digits(value);
  if (cpf.size() != 11 || all_same(cpf)) {
    return false;
  }

  int sum = 0;
  for (std::size_t i = 0; i < 9; ++i) {
    sum += digit_at(cpf, i) * static_cast<int>(10 - i);
  }
  if (digit_at(cpf, 9) != mod11_check_digit(sum)) {
    return false;
  }

  sum = 0;
  for (std::size_t i = 0; i < 10; ++i) {
    sum += digit_at(cpf, i) * static_cast<int>(11 - i);
  }
  return digit_at(cpf, 10) == mod11_check_digit(sum);
}

bool is_valid_cnpj(std::string_view value) {
  static constexpr std::array<int, 12> kFirstWeights{5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
  static constexpr std::array<int, 13> kSecondWeights{6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};

  const std::string cnpj = core::strip_non_digits(value);
  if (cnpj.size() != 14 || all_same(cnpj)) {
    return false;
  }

  int sum = 0;
  for (std::size_t i = 0; i < kFirstWeights.size(); ++i) {
    sum += digit_at(cnpj, i) * kFirstWeights[i];
  }
  if (digit_at(cnpj, 12) != mod11_check_digit(sum)) {
    return false;
  }

  sum = 0;
  for (std::size_t i = 0; i < kSecondWeights.size(); ++i) {
    sum += digit_at(cnpj, i) * kSecondWeights[i];
  }
  return digit_at(cnpj, 13) == mod11_check_digit(sum);
}

bool is_valid_cep(std::string_view value) {
  return core::strip_non_digits(value).size() == 8;
}

bool is_valid_phone(std::string_view value) {
  const std::size_t digits = core::strip_non_digits(value).size();
  return digits == 10 || digits == 11;
}

bool is_valid_isbn(std::string_view value) {
  const std::string isbn = strip_isbn_separators(value);
  if (isbn.size() == 10) {
    return is_valid_isbn10(isbn);
  }
  if (isbn.size() == 13) {
    return is_valid_isbn13(isbn);
  }
  return false;
}

bool is_valid_isbn10(std::string_view isbn) {
  if (isbn.size() != 10) {
    return false;
  }

  int sum = 0;
  for (std::size_t i = 0; i < 9; ++i) {
    if (!core::is_ascii_digit(isbn[i])) {
      return false;
    }
    sum += (isbn[i] - '0') * static_cast<int>(10 - i);
  }

  const char last = isbn[9];
  if (last == 'X' || last == 'x') {
    sum += 10;
  } else if (core::is_ascii_digit(last)) {
    sum += last - '0';
  } else {
    return false;
  }

  return sum % 11 == 0;
}

bool is_valid_isbn13(std::string_view isbn) {
  if (isbn.size() != 13) {
    return false;
  }

  int sum = 0;
  for (std::size_t i = 0; i < 13; ++i) {
    if (!core::is_ascii_digit(isbn[i])) {
      return false;
    }
    sum += (isbn[i] - '0') * (i % 2 == 0 ? 1 : 3);
  }
  return sum % 10 == 0;
}

bool is_valid_uuid(std::string_view value) {
  if (value.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < value.size(); ++i) {
    const bool hyphen_slot = i == 8 || i == 13 || i == 18 || i == 23;
    if (hyphen_slot != (value[i] == '-')) {
      return false;
    }
    if (!hyphen_slot && !is_hex(value[i])) {
      return false;
    }
  }

  const char version = value[14];
  const char variant = value[19];
  const bool version_ok = version >= '1' && version <= '5';
  const bool variant_ok = variant == '8' || variant == '9' || variant == 'a' || variant == 'b' ||
                          variant == 'A' || variant == 'B';
  return version_ok && variant_ok;
}

bool is_valid_base64(std::string_view value) {
  const auto decoded = core::base64_decode_forgiving(value);
  if (!decoded.has_value()) {
    return false;
  }
  return core::base64_encode(decoded.value()) == value;
}

bool is_strong_password(std::string_view value, std::size_t min_length) {
  if (core::utf8_length(value) < min_length) {
    return false;
  }

  bool has_upper = false;
  bool has_lower = false;
  bool has_digit = false;
  bool has_symbol = false;
  for (const char ch : value) {
    has_upper = has_upper || (ch >= 'A' && ch <= 'Z');
    has_lower = has_lower || (ch >= 'a' && ch <= 'z');
    has_digit = has_digit || core::is_ascii_digit(ch);
    has_symbol = has_symbol || kPasswordSymbols.find(ch) != std::string_view::npos;
  }
  return has_upper && has_lower && has_digit && has_symbol;
}

// ── Numeric coercion ────────────────────────────────────────────────────────

std::optional<double> parse_number_text(std::string_view text) {
  const std::string trimmed = core::trim(text);
  std::string_view body = trimmed;
  if (body.empty()) {
    return 0.0;
  }

  // Radix literals are unsigned.
  if (body.size() > 2 && body[0] == '0') {
    const char prefix = body[1];
    if (prefix == 'x' || prefix == 'X') {
      return parse_radix_literal(body.substr(2), 16);
    }
    if (prefix == 'o' || prefix == 'O') {
      return parse_radix_literal(body.substr(2), 8);
    }
    if (prefix == 'b' || prefix == 'B') {
      return parse_radix_literal(body.substr(2), 2);
    }
  }

  double sign = 1.0;
  if (body.front() == '+' || body.front() == '-') {
    sign = body.front() == '-' ? -1.0 : 1.0;
    body.remove_prefix(1);
  }

  if (body == "Infinity") {
    return sign * std::numeric_limits<double>::infinity();
  }
  if (!is_decimal_literal(body)) {
    return std::nullopt;
  }

  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(body.data(), body.data() + body.size(), value);
  if (ec == std::errc::result_out_of_range) {
    // Overflow saturates to infinity, underflow to zero.
    const std::size_t exponent = body.find_first_of("eE");
    const bool negative_exponent = exponent != std::string_view::npos &&
                                   exponent + 1 < body.size() && body[exponent + 1] == '-';
    return negative_exponent ? sign * 0.0 : sign * std::numeric_limits<double>::infinity();
  }
  if (ec != std::errc{} || ptr != body.data() + body.size()) {
    return std::nullopt;
  }
  return sign * value;
}

std::optional<double> to_number(const json& value) {
  if (value.is_number()) {
    return value.get<double>();
  }
  if (value.is_boolean()) {
    return value.get<bool>() ? 1.0 : 0.0;
  }
  if (value.is_null()) {
    return 0.0;
  }
  if (value.is_string()) {
    return parse_number_text(value.get_ref<const json::string_t&>());
  }
  return std::nullopt;
}

// ── Kind-level checkers ─────────────────────────────────────────────────────

// Length bounds count code points of the trimmed text. A rule's pattern still sees
// the untrimmed text, capped at kMaxPatternInputBytes.
bool check(const kinds::String& /*kind*/, const json& value, const Bounds& bounds) {
  const std::string* text = string_of(value);
  if (text == nullptr) {
    return false;
  }
  const auto length = static_cast<double>(core::utf8_length(core::trim(*text)));
  if (bounds.min.has_value() && length < bounds.min.value()) {
    return false;
  }
  if (bounds.max.has_value() && length > bounds.max.value()) {
    return false;
  }
  return true;
}

bool check(const kinds::Number& /*kind*/, const json& value, const Bounds& bounds) {
  const auto number = to_number(value);
  if (!number.has_value() || std::isnan(number.value())) {
    return false;
  }
  if (bounds.min.has_value() && number.value() < bounds.min.value()) {
    return false;
  }
  if (bounds.max.has_value() && number.value() > bounds.max.value()) {
    return false;
  }
  return true;
}

bool check(const kinds::Boolean& /*kind*/, const json& value, const Bounds& /*bounds*/) {
  if (value.is_boolean()) {
    return true;
  }
  if (value.is_number()) {
    const auto number = value.get<double>();
    return number == 0.0 || number == 1.0;
  }
  if (const std::string* text = string_of(value)) {
    return *text == "true" || *text == "false" || *text == "1" || *text == "0";
  }
  return false;
}

bool check(const kinds::Email& /*kind*/, const json& value, const Bounds& /*bounds*/) {
  if (const std::string* text = string_of(value)) {
    return is_valid_email(*text);
  }
  if (value.is_number() || value.is_boolean()) {
    return is_valid_email(value.dump());
  }
  return false;
}

bool check(const kinds::Url& /*kind*/, const json& value, const Bounds& /*bounds*/) {
  const std::string* text = string_of(value);
  return text != nullptr && is_valid_url(*text);
}

bool check(const kinds::Date& /*kind*/, const json& value, const Bounds& /*bounds*/) {
  if (value.is_number()) {
    // Epoch milliseconds.
    const auto millis = value.get<double>();
    return std::isfinite(millis) &&
           std::fabs(millis) <= static_cast<double>(core::kMaxAbsUnixMillis);
  }
  const std::string* text = string_of(value);
  return text != nullptr && is_valid_date(*text);
}

bool check(const kinds::Cpf& /*kind*/, const json& value, const Bounds& /*bounds*/) {
  const std::string* text = string_of(value);
  return text != nullptr && is_valid_cpf(*text);
}

bool check(const kinds::Cnpj& /*kind*/, const json& value, const Bounds& /*bounds*/) {
  const std::string* text = string_of(value);
  return text != nullptr && is_valid_cnpj(*text);
}

bool check(const kinds::Cep& /*kind*/, const json& value, const Bounds& /*bounds*/) {
  const std::string* text = string_of(value);
  return text != nullptr && is_valid_cep(*text);
}

bool check(const kinds::Phone& /*kind*/, const json& value, const Bounds& /*bounds*/) {
  const std::string* text = string_of(value);
  return text != nullptr && is_valid_phone(*text);
}

bool check(const kinds::Isbn& /*kind*/, const json& value, const Bounds& /*bounds*/) {
  const std::string* text = string_of(value);
  return text != nullptr && is_valid_isbn(*text);
}

bool check(const kinds::Uuid& /*kind*/, const json& value, const Bounds& /*bounds*/) {
  const std::string* text = string_of(value);
  return text != nullptr && is_valid_uuid(*text);
}

bool check(const kinds::Json& /*kind*/, const json& value, const Bounds& /*bounds*/) {
  const std::string* text = string_of(value);
  if (text == nullptr) {
    return true;  // already structured
  }
  return json::accept(*text);
}

bool check(const kinds::Base64& /*kind*/, const json& value, const Bounds& /*bounds*/) {
  const std::string* text = string_of(value);
  return text != nullptr && is_valid_base64(*text);
}

bool check(const kinds::Password& /*kind*/, const json& value, const Bounds& bounds) {
  const std::string* text = string_of(value);
  if (text == nullptr) {
    return false;
  }
  std::size_t min_length = kDefaultPasswordLength;
  if (bounds.min.has_value() && bounds.min.value() != 0.0) {
    const double wanted = std::ceil(bounds.min.value());
    // NaN and anything past size_t fail every password.
    if (!(wanted < static_cast<double>(std::numeric_limits<std::size_t>::max()))) {
      return false;
    }
    min_length = static_cast<std::size_t>(std::max(0.0, wanted));
  }
  return is_strong_password(*text, min_length);
}

bool check_kind(const RuleKind& kind, const json& value, const Bounds& bounds) {
  return std::visit([&](const auto& k) { return check(k, value, bounds); }, kind);
}

}  // namespace fguard::validation
