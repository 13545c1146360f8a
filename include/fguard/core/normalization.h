#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace fguard::core {

// Deterministic ASCII-only text helpers shared by the checkers, the sanitizer and
// the transforms. Locale-independent and byte-stable across platforms.
//
// - Whitespace is the ASCII set: space, \t, \n, \v, \f, \r
// - Case mapping touches A-Z / a-z only; other bytes (including UTF-8 sequences)
//   pass through unchanged

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\v' || ch == '\f' || ch == '\r';
}

inline bool is_ascii_digit(const char ch) {
  return ch >= '0' && ch <= '9';
}

inline bool is_ascii_alpha(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// to_ascii_upper converts ASCII lowercase (a-z) to uppercase (A-Z).
inline std::string to_ascii_upper(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'a' && ch <= 'z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch - kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  // All whitespace
  if (start == input.size()) {
    return std::string{};
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// strip_non_digits keeps only 0-9.
inline std::string strip_non_digits(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    if (is_ascii_digit(ch)) {
      result.push_back(ch);
    }
  }
  return result;
}

// collapse_whitespace replaces every run of whitespace with a single space.
// Leading/trailing runs become a single space too; trim first if unwanted.
inline std::string collapse_whitespace(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  bool in_run = false;
  for (const char ch : input) {
    if (is_ascii_space(ch)) {
      if (!in_run) {
        result.push_back(' ');
        in_run = true;
      }
    } else {
      result.push_back(ch);
      in_run = false;
    }
  }
  return result;
}

// utf8_length counts code points: every byte that is not a continuation byte
// (10xxxxxx) starts a new character. Malformed input is counted byte-wise.
inline std::size_t utf8_length(const std::string_view input) {
  std::size_t count = 0;
  for (const char ch : input) {
    if ((static_cast<unsigned char>(ch) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

}  // namespace fguard::core
