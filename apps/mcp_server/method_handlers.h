#pragma once

#include <nlohmann/json.hpp>

#include "ckmcp/core/result.h"
#include "ckmcp/protocol/jsonrpc.h"

#include "server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace ckmcp::mcp {

using MethodResult = core::Result<nlohmann::json, protocol::JsonRpcError>;

using MethodHandler =
    std::function<MethodResult(const protocol::JsonRpcMessage& req, ServerContext& ctx)>;
using NotificationHandler =
    std::function<void(const protocol::JsonRpcMessage& msg, ServerContext& ctx)>;

MethodResult handle_initialize(const protocol::JsonRpcMessage& req, ServerContext& ctx);
MethodResult handle_tools_list(const protocol::JsonRpcMessage& req, ServerContext& ctx);
MethodResult handle_tools_call(const protocol::JsonRpcMessage& req, ServerContext& ctx);
MethodResult handle_resources_list(const protocol::JsonRpcMessage& req, ServerContext& ctx);
MethodResult handle_resources_read(const protocol::JsonRpcMessage& req, ServerContext& ctx);

void handle_initialized(const protocol::JsonRpcMessage& msg, ServerContext& ctx);
void handle_roots_list_changed(const protocol::JsonRpcMessage& msg, ServerContext& ctx);

std::unordered_map<std::string, MethodHandler> build_method_registry();
std::unordered_map<std::string, NotificationHandler> build_notification_registry();

}  // namespace ckmcp::mcp
