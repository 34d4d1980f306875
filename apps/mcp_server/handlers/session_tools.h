#pragma once

#include <nlohmann/json.hpp>

#include "tool_registry.h"

namespace ckmcp::mcp::handlers {

// Snapshot shared by the getStatus tool and the ckmcp://status resource.
nlohmann::json build_status(ServerContext& ctx);

ToolResult handle_get_status(catalog::ToolId id, const nlohmann::json& args, ServerContext& ctx);
ToolResult handle_expand_toolset(catalog::ToolId id, const nlohmann::json& args,
                                 ServerContext& ctx);

}  // namespace ckmcp::mcp::handlers
