#pragma once

namespace ckmcp::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "0.3.0";

// kProtocolVersion is the MCP protocol revision advertised in initialize.
constexpr const char* kProtocolVersion = "2024-11-05";

}  // namespace ckmcp::core
