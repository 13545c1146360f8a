#pragma once

#include "server_context.h"
#include <istream>
#include <ostream>
#include <string>

namespace fguard::mcp {

// handle_line processes one JSON-RPC message and returns the response line.
// Tool handlers that throw validation::ValidationFailed produce a kInvalidParams
// error carrying the serialized failure as data.
std::string handle_line(const std::string& line, ServerContext& ctx);

// Reads newline-delimited requests from `in` until EOF, one response per line to `out`.
void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace fguard::mcp
