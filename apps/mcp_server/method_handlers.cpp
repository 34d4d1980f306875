#include "method_handlers.h"

#include "ckmcp/catalog/catalog.h"
#include "ckmcp/core/version.h"
#include "ckmcp/pagination/paginator.h"
#include "ckmcp/session/roots.h"

#include "handlers/resources.h"
#include "handlers/tool_registry.h"
#include <exception>
#include <iostream>
#include <utility>

namespace ckmcp::mcp {

using json = nlohmann::json;

namespace {

MethodResult rpc_error(int code, std::string message, json data = nullptr) {
  return MethodResult::err(protocol::JsonRpcError{
      .code = code,
      .message = std::move(message),
      .data = std::move(data),
  });
}

// Absent params read as an empty object; present non-object params are rejected by callers
// that require an object.
json params_or_empty(const protocol::JsonRpcMessage& req) {
  if (req.params.has_value() && req.params->is_object()) {
    return req.params.value();
  }
  return json::object();
}

bool params_are_object(const protocol::JsonRpcMessage& req) {
  return req.params.has_value() && req.params->is_object();
}

// Tool payloads must not fail to serialize over invalid UTF-8 from the index.
std::string to_text(const json& value) {
  return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

json text_content(const json& payload, bool is_error) {
  json result{
      {"content", json::array({{{"type", "text"}, {"text", to_text(payload)}}})},
  };
  if (is_error) {
    result["isError"] = true;
  }
  return result;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Lifecycle
// ────────────────────────────────────────────────────────────────

MethodResult handle_initialize(const protocol::JsonRpcMessage& req, ServerContext& ctx) {
  const auto caps = session::parse_client_capabilities(params_or_empty(req));
  ctx.session.set_client_capabilities(caps);
  std::cerr << "Client roots capability: " << (caps.roots ? "yes" : "no")
            << (caps.roots_list_changed ? " (listChanged)" : "") << "\n";

  return MethodResult::ok(json{
      {"protocolVersion", core::kProtocolVersion},
      {"capabilities", {{"tools", {{"listChanged", true}}}, {"resources", json::object()}}},
      {"serverInfo", {{"name", "ckmcp"}, {"version", core::kBuildVersion}}},
  });
}

void handle_initialized(const protocol::JsonRpcMessage& /*msg*/, ServerContext& ctx) {
  std::cerr << "Client initialized\n";
  ctx.roots.request_roots();
}

void handle_roots_list_changed(const protocol::JsonRpcMessage& /*msg*/, ServerContext& ctx) {
  std::cerr << "Client roots changed, requesting update\n";
  ctx.roots.request_roots();
}

// ────────────────────────────────────────────────────────────────
// Tools
// ────────────────────────────────────────────────────────────────

MethodResult handle_tools_list(const protocol::JsonRpcMessage& req, ServerContext& ctx) {
  const json params = params_or_empty(req);

  std::string cursor;
  if (params.contains("cursor") && !params["cursor"].is_null()) {
    if (!params["cursor"].is_string()) {
      return rpc_error(protocol::kInvalidParams, "Invalid cursor: expected a string");
    }
    cursor = params["cursor"].get<std::string>();
  }

  // One snapshot: the cursor is checked against the same preset and fingerprint it pages.
  const auto toolset = ctx.session.toolset();

  auto offset = pagination::decode_cursor(cursor, toolset.preset, toolset.fingerprint);
  if (!offset.has_value()) {
    return rpc_error(protocol::kInvalidParams, "Invalid cursor: " + offset.error(),
                     json{{"reason", offset.error()}});
  }

  const auto page = pagination::paginate(toolset.tools, offset.value(), ctx.config.page_size,
                                         toolset.preset, toolset.fingerprint);

  json result{{"tools", catalog::tools_to_json(page.items)}};
  if (page.next_cursor.has_value()) {
    result["nextCursor"] = page.next_cursor.value();
  }
  return MethodResult::ok(std::move(result));
}

MethodResult handle_tools_call(const protocol::JsonRpcMessage& req, ServerContext& ctx) {
  if (!params_are_object(req)) {
    return rpc_error(protocol::kInvalidParams, "Invalid params: expected object");
  }
  const json& params = req.params.value();

  if (!params.contains("name") || !params["name"].is_string()) {
    return rpc_error(protocol::kInvalidParams, "Invalid params: name is required");
  }
  const auto name = params["name"].get<std::string>();

  json arguments = json::object();
  if (params.contains("arguments") && params["arguments"].is_object()) {
    arguments = params["arguments"];
  }

  // Unknown names are rejected before any handler runs.
  const auto id = catalog::find_tool_id(name);
  if (!id.has_value()) {
    return rpc_error(protocol::kNotFound, "Tool not found", json{{"name", name}});
  }

  std::cerr << "Calling tool: " << name << "\n";

  try {
    auto outcome = handlers::call_tool(id.value(), arguments, ctx);
    if (outcome.has_value()) {
      return MethodResult::ok(text_content(outcome.value(), false));
    }

    const auto& failure = outcome.error();
    if (failure.kind == handlers::ToolFailure::Kind::kProtocol) {
      return rpc_error(failure.rpc_code, failure.message, failure.data);
    }
    return MethodResult::ok(text_content(
        json{{"error", {{"code", failure.code}, {"message", failure.message}}}}, true));
  } catch (const std::exception& e) {
    std::cerr << "Tool " << name << " failed: " << e.what() << "\n";
    return rpc_error(protocol::kInternalError, std::string("Internal error: ") + e.what());
  }
}

// ────────────────────────────────────────────────────────────────
// Resources
// ────────────────────────────────────────────────────────────────

MethodResult handle_resources_list(const protocol::JsonRpcMessage& /*req*/,
                                   ServerContext& /*ctx*/) {
  return MethodResult::ok(handlers::list_resources());
}

MethodResult handle_resources_read(const protocol::JsonRpcMessage& req, ServerContext& ctx) {
  if (!params_are_object(req)) {
    return rpc_error(protocol::kInvalidParams, "Invalid params: expected object");
  }
  const json& params = req.params.value();
  if (!params.contains("uri") || !params["uri"].is_string()) {
    return rpc_error(protocol::kInvalidParams, "Invalid params: uri is required");
  }
  const auto uri = params["uri"].get<std::string>();

  std::cerr << "Reading resource: " << uri << "\n";

  try {
    auto document = handlers::read_resource(uri, ctx);
    if (!document.has_value()) {
      return MethodResult::err(document.error());
    }
    return MethodResult::ok(json{
        {"contents", json::array({{{"uri", uri},
                                   {"mimeType", "application/json"},
                                   {"text", to_text(document.value())}}})},
    });
  } catch (const std::exception& e) {
    std::cerr << "Resource " << uri << " failed: " << e.what() << "\n";
    return rpc_error(protocol::kInternalError, std::string("Internal error: ") + e.what());
  }
}

// ────────────────────────────────────────────────────────────────
// Registries
// ────────────────────────────────────────────────────────────────

std::unordered_map<std::string, MethodHandler> build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
      {"resources/list", handle_resources_list},
      {"resources/read", handle_resources_read},
  };
}

std::unordered_map<std::string, NotificationHandler> build_notification_registry() {
  return {
      {"notifications/initialized", handle_initialized},
      {"notifications/roots/list_changed", handle_roots_list_changed},
  };
}

}  // namespace ckmcp::mcp
