#include "fguard/sanitize/sanitizer.h"

#include "fguard/core/normalization.h"

namespace fguard::sanitize {

using json = nlohmann::json;

namespace {

// Removes each '<' through the next '>'. A '<' with no closing '>' is kept as text.
std::string strip_tags(std::string_view text) {
  std::string result;
  result.reserve(text.size());

  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t open = text.find('<', pos);
    if (open == std::string_view::npos) {
      result.append(text.substr(pos));
      break;
    }
    const std::size_t close = text.find('>', open + 1);
    if (close == std::string_view::npos) {
      result.append(text.substr(pos));
      break;
    }
    result.append(text.substr(pos, open - pos));
    pos = close + 1;
  }

  return result;
}

}  // namespace

std::string sanitize_string(std::string_view text) {
  return core::collapse_whitespace(core::trim(strip_tags(text)));
}

json sanitize(const json& value) {
  if (value.is_string()) {
    return sanitize_string(value.get_ref<const json::string_t&>());
  }
  if (value.is_array()) {
    json out = json::array();
    for (const auto& element : value) {
      out.push_back(sanitize(element));
    }
    return out;
  }
  if (value.is_object()) {
    json out = json::object();
    for (const auto& item : value.items()) {
      out[item.key()] = sanitize(item.value());
    }
    return out;
  }
  return value;
}

}  // namespace fguard::sanitize
