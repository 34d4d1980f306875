#pragma once

#include <nlohmann/json.hpp>

#include "ckmcp/core/result.h"
#include "ckmcp/protocol/jsonrpc.h"

#include "../server_context.h"
#include <string>

namespace ckmcp::mcp::handlers {

constexpr const char* kResourceScheme = "ckmcp://";

// {"resources": [...], "resourceTemplates": [...]}
nlohmann::json list_resources();

// Reads ckmcp://status, ckmcp://architecture, ckmcp://module/{id} or ckmcp://symbol/{id}.
// The value is the resource's JSON document; errors are JSON-RPC errors.
core::Result<nlohmann::json, protocol::JsonRpcError> read_resource(const std::string& uri,
                                                                   ServerContext& ctx);

}  // namespace ckmcp::mcp::handlers
