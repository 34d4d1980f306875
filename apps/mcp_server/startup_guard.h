#pragma once

#include "config.h"
#include <string>

namespace ckmcp::mcp {

// validate_mcp_server_config checks startup preconditions for the MCP server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - every flag parsed
// - preset is one of the known presets
// - page size, max engines, roots timeout and max message bytes are positive
[[nodiscard]] std::string validate_mcp_server_config(const McpServerConfig& config);

}  // namespace ckmcp::mcp
