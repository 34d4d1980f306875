#include "resources.h"

#include "session_tools.h"
#include "tool_registry.h"

#include <string_view>
#include <utility>

namespace ckmcp::mcp::handlers {

using json = nlohmann::json;
using ReadResult = core::Result<json, protocol::JsonRpcError>;

namespace {

ReadResult rpc_error(int code, std::string message) {
  return ReadResult::err(protocol::JsonRpcError{
      .code = code,
      .message = std::move(message),
      .data = nullptr,
  });
}

// Business failures have no payload to ride in here, so they become JSON-RPC errors.
ReadResult from_failure(const ToolFailure& failure) {
  if (failure.kind == ToolFailure::Kind::kProtocol) {
    return ReadResult::err(protocol::JsonRpcError{
        .code = failure.rpc_code,
        .message = failure.message,
        .data = failure.data,
    });
  }
  const bool not_found =
      failure.code == engine::engine_error_code_name(engine::EngineErrorCode::kNotFound);
  return ReadResult::err(protocol::JsonRpcError{
      .code = not_found ? protocol::kNotFound : protocol::kInternalError,
      .message = failure.message,
      .data = json{{"code", failure.code}},
  });
}

ReadResult query_active(ServerContext& ctx, std::string_view operation, const json& args) {
  auto lease = ctx.engines.acquire();
  if (!lease.has_value()) {
    return from_failure(pool_failure(lease.error()));
  }
  auto result = lease.value()->query(operation, args);
  if (!result.has_value()) {
    return from_failure(engine_failure(result.error()));
  }
  return ReadResult::ok(std::move(result.value()));
}

json resource(const char* uri, const char* name, const char* description) {
  return json{
      {"uri", uri},
      {"name", name},
      {"description", description},
      {"mimeType", "application/json"},
  };
}

json resource_template(const char* uri_template, const char* name, const char* description) {
  return json{
      {"uriTemplate", uri_template},
      {"name", name},
      {"description", description},
      {"mimeType", "application/json"},
  };
}

}  // namespace

json list_resources() {
  return json{
      {"resources", json::array({
                        resource("ckmcp://status", "Server status",
                                 "Active preset, loaded engines and index health"),
                        resource("ckmcp://architecture", "Repository architecture",
                                 "Module dependency overview of the active repository"),
                    })},
      {"resourceTemplates",
       json::array({
           resource_template("ckmcp://module/{moduleId}", "Module overview",
                             "Overview of one module"),
           resource_template("ckmcp://symbol/{symbolId}", "Symbol details",
                             "Details for one symbol by stable ID"),
       })},
  };
}

ReadResult read_resource(const std::string& uri, ServerContext& ctx) {
  const std::string_view scheme(kResourceScheme);
  if (uri.compare(0, scheme.size(), scheme) != 0) {
    return rpc_error(protocol::kInvalidParams, "invalid URI scheme");
  }
  const std::string_view rest = std::string_view(uri).substr(scheme.size());

  const auto slash = rest.find('/');
  const std::string_view type = rest.substr(0, slash);
  const std::string id =
      slash == std::string_view::npos ? std::string() : std::string(rest.substr(slash + 1));

  if (type == "status") {
    return ReadResult::ok(build_status(ctx));
  }
  if (type == "architecture") {
    return query_active(ctx, "getArchitecture", json::object());
  }
  if (type == "module") {
    if (id.empty()) {
      return rpc_error(protocol::kInvalidParams, "module URI requires module ID");
    }
    return query_active(ctx, "getModuleOverview", json{{"path", id}});
  }
  if (type == "symbol") {
    if (id.empty()) {
      return rpc_error(protocol::kInvalidParams, "symbol URI requires symbol ID");
    }
    return query_active(ctx, "getSymbol", json{{"symbolId", id}});
  }
  return rpc_error(protocol::kNotFound, "unknown resource type");
}

}  // namespace ckmcp::mcp::handlers
