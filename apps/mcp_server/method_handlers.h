#pragma once

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace fguard::mcp {

using MethodHandler = std::function<nlohmann::json(const JsonRpcRequest& req, ServerContext& ctx)>;

// Answers the MCP handshake with the fguard server name and build version.
nlohmann::json handle_initialize(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_tools_list(const JsonRpcRequest& req, ServerContext& ctx);
// Dispatches to validate_record, check_value, sanitize_input or list_schemas.
nlohmann::json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx);

// Maps "initialize", "tools/list" and "tools/call" to their handlers; any other
// method is answered with -32601 by the server loop.
std::unordered_map<std::string, MethodHandler> build_method_registry();

}  // namespace fguard::mcp
