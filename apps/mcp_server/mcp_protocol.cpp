#include "mcp_protocol.h"

namespace fguard::mcp {

std::optional<JsonRpcRequest> parse_request(const std::string& json_str) {
  const auto json = nlohmann::json::parse(json_str, nullptr, /*allow_exceptions=*/false);
  if (json.is_discarded() || !json.is_object()) {
    return std::nullopt;
  }

  JsonRpcRequest request;
  const auto version = json.find("jsonrpc");
  if (version != json.end() && version->is_string()) {
    request.jsonrpc = version->get<std::string>();
  }

  if (json.contains("id") && (json["id"].is_string() || json["id"].is_number())) {
    request.id = json["id"];
  }

  const auto method = json.find("method");
  if (method != json.end() && method->is_string()) {
    request.method = method->get<std::string>();
  }

  const auto params = json.find("params");
  request.params =
      params != json.end() && params->is_object() ? *params : nlohmann::json::object();

  return request;
}

std::string make_response(const nlohmann::json& id, const nlohmann::json& result) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id;
  response["result"] = result;
  return response.dump();
}

std::string make_error_response(const nlohmann::json& id, int code, const std::string& message,
                                const nlohmann::json& data) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id;
  response["error"] = {
      {"code", code},
      {"message", message},
      {"data", data},
  };
  return response.dump();
}

}  // namespace fguard::mcp
