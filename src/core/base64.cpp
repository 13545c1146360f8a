#include "fguard/core/base64.h"

#include "fguard/core/normalization.h"

#include <cstdint>

namespace fguard::core {

namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int sextet_of(const char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return ch - 'A';
  }
  if (ch >= 'a' && ch <= 'z') {
    return ch - 'a' + 26;
  }
  if (ch >= '0' && ch <= '9') {
    return ch - '0' + 52;
  }
  if (ch == '+') {
    return 62;
  }
  if (ch == '/') {
    return 63;
  }
  return -1;
}

std::uint32_t octet(std::string_view bytes, std::size_t index) {
  return static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[index]));
}

}  // namespace

std::string base64_encode(std::string_view bytes) {
  std::string out;
  out.reserve(((bytes.size() + 2) / 3) * 4);

  std::size_t i = 0;
  for (; i + 3 <= bytes.size(); i += 3) {
    const std::uint32_t chunk =
        (octet(bytes, i) << 16U) | (octet(bytes, i + 1) << 8U) | octet(bytes, i + 2);
    out.push_back(kAlphabet[(chunk >> 18U) & 0x3FU]);
    out.push_back(kAlphabet[(chunk >> 12U) & 0x3FU]);
    out.push_back(kAlphabet[(chunk >> 6U) & 0x3FU]);
    out.push_back(kAlphabet[chunk & 0x3FU]);
  }

  const std::size_t rest = bytes.size() - i;
  if (rest == 1) {
    const std::uint32_t chunk = octet(bytes, i) << 16U;
    out.push_back(kAlphabet[(chunk >> 18U) & 0x3FU]);
    out.push_back(kAlphabet[(chunk >> 12U) & 0x3FU]);
    out.append("==");
  } else if (rest == 2) {
    const std::uint32_t chunk = (octet(bytes, i) << 16U) | (octet(bytes, i + 1) << 8U);
    out.push_back(kAlphabet[(chunk >> 18U) & 0x3FU]);
    out.push_back(kAlphabet[(chunk >> 12U) & 0x3FU]);
    out.push_back(kAlphabet[(chunk >> 6U) & 0x3FU]);
    out.push_back('=');
  }

  return out;
}

std::optional<std::string> base64_decode_forgiving(std::string_view text) {
  std::string data;
  data.reserve(text.size());
  for (const char ch : text) {
    if (ch != '\v' && is_ascii_space(ch)) {
      continue;
    }
    data.push_back(ch);
  }

  if (data.size() % 4 == 0) {
    if (data.size() >= 2 && data[data.size() - 1] == '=' && data[data.size() - 2] == '=') {
      data.resize(data.size() - 2);
    } else if (!data.empty() && data.back() == '=') {
      data.pop_back();
    }
  }

  if (data.size() % 4 == 1) {
    return std::nullopt;
  }

  std::string out;
  out.reserve((data.size() * 3) / 4);
  std::uint32_t buffer = 0;
  int bits = 0;
  for (const char ch : data) {
    const int sextet = sextet_of(ch);
    if (sextet < 0) {
      return std::nullopt;
    }
    buffer = (buffer << 6U) | static_cast<std::uint32_t>(sextet);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<char>((buffer >> static_cast<unsigned>(bits)) & 0xFFU));
    }
  }

  return out;
}

}  // namespace fguard::core
