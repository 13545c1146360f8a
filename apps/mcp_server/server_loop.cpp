#include "server_loop.h"

#include "fguard/validation/validation_result.h"

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "method_handlers.h"
#include <exception>
#include <iostream>
#include <string>

namespace fguard::mcp {

using json = nlohmann::json;

std::string handle_line(const std::string& line, ServerContext& ctx) {
  static const auto method_registry = build_method_registry();

  auto request_opt = parse_request(line);
  if (!request_opt.has_value()) {
    return make_error_response(nullptr, kParseError, "Invalid JSON");
  }

  const auto& request = request_opt.value();
  std::cerr << "Received: " << request.method << "\n";

  // Dispatch via method registry
  auto it = method_registry.find(request.method);
  if (it == method_registry.end()) {
    return make_error_response(request.id, kMethodNotFound, "Unknown method: " + request.method);
  }

  try {
    return make_response(request.id, it->second(request, ctx));
  } catch (const validation::ValidationFailed& failure) {
    return make_error_response(request.id, kInvalidParams, failure.what(),
                               validation::validation_failed_to_json(failure, ctx.clock));
  } catch (const std::exception& e) {
    std::cerr << "Internal error in " << request.method << ": " << e.what() << "\n";
    return make_error_response(request.id, kInternalError, e.what());
  }
}

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  // Main loop: read JSON-RPC requests, write one response line each
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    out << handle_line(line, ctx) << "\n" << std::flush;
  }

  std::cerr << "MCP Server shutting down\n";
}

}  // namespace fguard::mcp
