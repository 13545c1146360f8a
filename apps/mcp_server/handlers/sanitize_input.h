#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace fguard::mcp::handlers {

nlohmann::json handle_sanitize_input(const nlohmann::json& params, ServerContext& ctx);

}  // namespace fguard::mcp::handlers
