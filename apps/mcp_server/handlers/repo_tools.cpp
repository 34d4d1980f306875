#include "repo_tools.h"

#include "ckmcp/repos/registry.h"

#include <iostream>
#include <string>

namespace ckmcp::mcp::handlers {

using json = nlohmann::json;

namespace {

constexpr const char* kMultiRepoDisabled =
    "Multi-repo mode not enabled. Start MCP server with a registry.";

bool multi_repo_enabled(const ServerContext& ctx) {
  return ctx.registry != nullptr && ctx.engines.multi_repo();
}

ToolFailure multi_repo_disabled() {
  return protocol_failure(protocol::kInvalidRequest, kMultiRepoDisabled);
}

}  // namespace

ToolResult handle_list_repos(catalog::ToolId /*id*/, const json& /*args*/, ServerContext& ctx) {
  if (!multi_repo_enabled(ctx)) {
    return ToolResult::err(multi_repo_disabled());
  }

  const auto active = ctx.engines.active();
  const std::string active_name = active.has_value() ? active->repo_name : "";

  json listed = json::array();
  for (const auto& entry : ctx.registry->list()) {
    listed.push_back({
        {"name", entry.name},
        {"path", entry.path},
        {"state", std::string(repos::repo_state_name(ctx.registry->state_of(entry)))},
        {"isDefault", entry.name == ctx.registry->default_repo()},
        {"isActive", active.has_value() && active->repo_path == entry.path},
        {"isLoaded", ctx.engines.is_loaded(entry.path)},
    });
  }

  return ToolResult::ok(json{
      {"repos", listed},
      {"activeRepo", active_name},
      {"default", ctx.registry->default_repo()},
  });
}

ToolResult handle_switch_repo(catalog::ToolId /*id*/, const json& args, ServerContext& ctx) {
  if (!multi_repo_enabled(ctx)) {
    return ToolResult::err(multi_repo_disabled());
  }

  if (!args.is_object() || !args.contains("name") || !args["name"].is_string() ||
      args["name"].get<std::string>().empty()) {
    return ToolResult::err(
        protocol_failure(protocol::kInvalidParams, "name parameter is required"));
  }
  const auto name = args["name"].get<std::string>();

  const auto entry = ctx.registry->get(name);
  if (!entry.has_value()) {
    return ToolResult::err(
        protocol_failure(protocol::kInvalidParams, "Repository not found: " + name));
  }

  switch (ctx.registry->state_of(entry.value())) {
    case repos::RepoState::kMissing:
      return ToolResult::err(protocol_failure(
          protocol::kInvalidParams, "Path does not exist: " + entry->path,
          json{{"hint", "Remove '" + name + "' from the repository registry"}}));
    case repos::RepoState::kUninitialized:
      return ToolResult::err(protocol_failure(
          protocol::kInvalidParams, "Repository not initialized: " + entry->path,
          json{{"hint", "Build the index under " + entry->path + "/.ckmcp first"}}));
    case repos::RepoState::kValid:
      break;
  }

  auto switched = ctx.engines.switch_active(entry->name, entry->path);
  if (!switched.has_value()) {
    return ToolResult::err(pool_failure(switched.error()));
  }

  std::cerr << "Switched active repository: " << name << " (" << entry->path << ")\n";
  return ToolResult::ok(json{
      {"success", true},
      {"activeRepo", name},
      {"path", entry->path},
  });
}

ToolResult handle_get_active_repo(catalog::ToolId /*id*/, const json& /*args*/,
                                  ServerContext& ctx) {
  if (!multi_repo_enabled(ctx)) {
    return ToolResult::err(multi_repo_disabled());
  }

  const auto active = ctx.engines.active();
  if (!active.has_value()) {
    return ToolResult::ok(json{
        {"name", nullptr},
        {"state", "none"},
        {"error", "No active repository. Call switchRepo first or set a default."},
    });
  }

  const repos::RepoEntry entry{.name = active->repo_name, .path = active->repo_path};
  return ToolResult::ok(json{
      {"name", active->repo_name},
      {"path", active->repo_path},
      {"state", std::string(repos::repo_state_name(ctx.registry->state_of(entry)))},
  });
}

}  // namespace ckmcp::mcp::handlers
