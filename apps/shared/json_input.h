#pragma once

#include "fguard/core/result.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <istream>
#include <string>
#include <utility>

namespace fguard::apps {

using JsonResult = core::Result<nlohmann::json, std::string>;

// Parse one JSON document from a stream. `origin` names the source in errors.
inline JsonResult read_json_stream(std::istream& in, const std::string& origin) {
  nlohmann::json parsed = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded()) {
    return JsonResult::err("Invalid JSON in " + origin);
  }
  return JsonResult::ok(std::move(parsed));
}

// Read a JSON document from `path`, or from stdin when path is "-".
inline JsonResult read_json_input(const std::string& path) {
  if (path == "-") {
    return read_json_stream(std::cin, "stdin");
  }
  std::ifstream file(path);
  if (!file) {
    return JsonResult::err("Cannot open " + path);
  }
  return read_json_stream(file, path);
}

}  // namespace fguard::apps
