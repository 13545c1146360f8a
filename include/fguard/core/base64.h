#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fguard::core {

// base64_encode returns the standard-alphabet (RFC 4648 section 4) encoding, padded with '='.
[[nodiscard]] std::string base64_encode(std::string_view bytes);

// base64_decode_forgiving implements the WHATWG "forgiving-base64 decode":
// - ASCII whitespace is removed
// - if the length is a multiple of 4, one or two trailing '=' are dropped
// - a remaining length of 1 (mod 4) or any character outside A-Z a-z 0-9 + / fails
// - leftover bits after the last full byte are discarded
// Returns nullopt on failure.
[[nodiscard]] std::optional<std::string> base64_decode_forgiving(std::string_view text);

}  // namespace fguard::core
