#pragma once

namespace fguard::core {

// Reported in startup banners and the MCP initialize response.
constexpr const char* kBuildVersion = "0.3";
constexpr const char* kServerName = "fguard";

}  // namespace fguard::core
