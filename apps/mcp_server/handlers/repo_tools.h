#pragma once

#include <nlohmann/json.hpp>

#include "tool_registry.h"

namespace ckmcp::mcp::handlers {

// Multi-repo tools. In legacy single-engine mode each reports that multi-repo mode is off.
ToolResult handle_list_repos(catalog::ToolId id, const nlohmann::json& args, ServerContext& ctx);
ToolResult handle_switch_repo(catalog::ToolId id, const nlohmann::json& args, ServerContext& ctx);
ToolResult handle_get_active_repo(catalog::ToolId id, const nlohmann::json& args,
                                  ServerContext& ctx);

}  // namespace ckmcp::mcp::handlers
