#pragma once

#include <nlohmann/json.hpp>

#include "tool_registry.h"

namespace ckmcp::mcp::handlers {

// Forwards the call to the active repository's engine; the operation is the tool's name.
ToolResult handle_engine_query(catalog::ToolId id, const nlohmann::json& args,
                               ServerContext& ctx);

// Compound tools: several engine queries under one lease.
ToolResult handle_explore(catalog::ToolId id, const nlohmann::json& args, ServerContext& ctx);
ToolResult handle_understand(catalog::ToolId id, const nlohmann::json& args, ServerContext& ctx);
ToolResult handle_prepare_change(catalog::ToolId id, const nlohmann::json& args,
                                 ServerContext& ctx);

}  // namespace ckmcp::mcp::handlers
