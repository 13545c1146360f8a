#include "sanitize_input.h"

#include "fguard/sanitize/sanitizer.h"

namespace fguard::mcp::handlers {

using json = nlohmann::json;

json handle_sanitize_input(const json& params, ServerContext& /*ctx*/) {
  if (!params.contains("data")) {
    json error_result;
    error_result["error"] = "'data' is required";
    return error_result;
  }

  json result;
  result["data"] = sanitize::sanitize(params.at("data"));
  return result;
}

}  // namespace fguard::mcp::handlers
