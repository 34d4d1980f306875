#include "session_tools.h"

#include "ckmcp/core/version.h"
#include "ckmcp/session/roots.h"

#include <iostream>
#include <string>

namespace ckmcp::mcp::handlers {

using json = nlohmann::json;

namespace {

json engine_info_to_json(const engine::EngineInfo& info) {
  return json{
      {"name", info.repo_name},
      {"path", info.repo_path},
      {"loadedAt", info.loaded_at},
      {"idleMs", info.idle_ms},
      {"activeOps", info.active_ops},
      {"active", info.active},
  };
}

std::string required_string(const json& args, const char* key) {
  if (args.is_object() && args.contains(key) && args[key].is_string()) {
    return args[key].get<std::string>();
  }
  return "";
}

}  // namespace

json build_status(ServerContext& ctx) {
  const auto toolset = ctx.session.toolset();

  json loaded = json::array();
  for (const auto& info : ctx.engines.loaded()) {
    loaded.push_back(engine_info_to_json(info));
  }

  json status{
      {"server", {{"name", "ckmcp"},
                  {"version", core::kBuildVersion},
                  {"protocolVersion", core::kProtocolVersion}}},
      {"toolset",
       {{"preset", toolset.preset},
        {"exposedTools", toolset.tools.size()},
        {"totalTools", ctx.session.catalog_size()},
        {"fingerprint", toolset.fingerprint},
        {"expanded", toolset.expanded}}},
      {"roots",
       {{"supported", ctx.session.roots_supported()},
        {"roots", session::roots_to_json(ctx.session.roots())}}},
      {"engines",
       {{"mode", ctx.engines.multi_repo() ? "multi-repo" : "single"},
        {"capacity", ctx.engines.capacity()},
        {"loaded", loaded}}},
  };

  // The lease is held only while reading the engine's health.
  auto lease = ctx.engines.acquire();
  if (lease.has_value()) {
    status["repository"] = {
        {"name", lease.value().repo_name()},
        {"path", lease.value().repo_path()},
        {"index", lease.value()->status()},
    };
  } else {
    status["repository"] = {
        {"error", lease.error().message},
        {"code", std::string(engine::pool_error_code_name(lease.error().code))},
    };
  }
  return status;
}

ToolResult handle_get_status(catalog::ToolId /*id*/, const json& /*args*/, ServerContext& ctx) {
  return ToolResult::ok(build_status(ctx));
}

ToolResult handle_expand_toolset(catalog::ToolId /*id*/, const json& args, ServerContext& ctx) {
  const auto preset = required_string(args, "preset");
  if (preset.empty()) {
    return ToolResult::err(protocol_failure(protocol::kInvalidParams, "preset is required"));
  }
  const auto reason = required_string(args, "reason");
  if (reason.empty()) {
    return ToolResult::err(protocol_failure(protocol::kInvalidParams, "reason is required"));
  }

  auto change = ctx.session.expand_to(preset);
  if (!change.has_value()) {
    return ToolResult::err(protocol_failure(protocol::kInvalidParams, change.error()));
  }

  const auto& applied = change.value();
  std::cerr << "Toolset expanded: " << applied.previous << " -> " << applied.current << " ("
            << applied.tool_count << " tools), reason: " << reason << "\n";

  if (!ctx.writer.write(protocol::make_notification("notifications/tools/list_changed"))) {
    std::cerr << "Failed to send notifications/tools/list_changed\n";
  }

  return ToolResult::ok(json{
      {"expanded", true},
      {"previousPreset", applied.previous},
      {"preset", applied.current},
      {"toolCount", applied.tool_count},
      {"fingerprint", applied.fingerprint},
      {"reason", reason},
  });
}

}  // namespace ckmcp::mcp::handlers
