#include "engine_tools.h"

#include "ckmcp/catalog/catalog.h"

#include <cstdint>
#include <set>
#include <string>

namespace ckmcp::mcp::handlers {

using json = nlohmann::json;
using engine::EngineErrorCode;

namespace {

std::string string_arg(const json& args, const char* key, const std::string& fallback = "") {
  if (args.is_object() && args.contains(key) && args[key].is_string()) {
    return args[key].get<std::string>();
  }
  return fallback;
}

bool bool_arg(const json& args, const char* key, bool fallback) {
  if (args.is_object() && args.contains(key) && args[key].is_boolean()) {
    return args[key].get<bool>();
  }
  return fallback;
}

bool is_not_found(const engine::QueryResult& result) {
  return !result.has_value() && result.error().code == EngineErrorCode::kNotFound;
}

// Resolves a stable ID first, then falls back to the best name match.
engine::QueryResult resolve_symbol(engine::IQueryEngine& engine, const std::string& query) {
  auto direct = engine.query("getSymbol", json{{"symbolId", query}});
  if (!is_not_found(direct)) {
    return direct;
  }
  auto search = engine.query("searchSymbols", json{{"query", query}, {"limit", 1}});
  if (!search.has_value()) {
    return search;
  }
  const auto& symbols = search.value()["symbols"];
  if (!symbols.is_array() || symbols.empty()) {
    return engine::QueryResult::err(engine::EngineError{
        .code = EngineErrorCode::kNotFound,
        .message = "symbol not found: " + query,
    });
  }
  return engine::QueryResult::ok(json{{"symbol", symbols.front()}});
}

std::string risk_level(std::int64_t references, std::size_t files) {
  if (references >= 20 || files >= 10) {
    return "high";
  }
  if (references >= 5 || files >= 3) {
    return "medium";
  }
  return "low";
}

}  // namespace

ToolResult handle_engine_query(catalog::ToolId id, const json& args, ServerContext& ctx) {
  auto lease = ctx.engines.acquire();
  if (!lease.has_value()) {
    return ToolResult::err(pool_failure(lease.error()));
  }

  auto result = lease.value()->query(catalog::tool_name(id), args);
  if (!result.has_value()) {
    return ToolResult::err(engine_failure(result.error()));
  }
  return ToolResult::ok(std::move(result.value()));
}

// ────────────────────────────────────────────────────────────────
// Compound tools
// ────────────────────────────────────────────────────────────────

ToolResult handle_explore(catalog::ToolId /*id*/, const json& args, ServerContext& ctx) {
  const auto target = string_arg(args, "target");
  if (target.empty()) {
    return ToolResult::err(protocol_failure(protocol::kInvalidParams, "target is required"));
  }
  const auto depth = string_arg(args, "depth", "standard");

  auto lease = ctx.engines.acquire();
  if (!lease.has_value()) {
    return ToolResult::err(pool_failure(lease.error()));
  }
  auto& engine = lease.value().engine();

  json out{{"target", target}, {"depth", depth}};

  auto file = engine.query("explainFile", json{{"filePath", target}});
  if (file.has_value()) {
    out["kind"] = "file";
    out["overview"] = std::move(file.value());
  } else if (!is_not_found(file)) {
    return ToolResult::err(engine_failure(file.error()));
  } else {
    auto module = engine.query("getModuleOverview", json{{"path", target}});
    if (is_not_found(module)) {
      return ToolResult::err(
          business_failure(engine::engine_error_code_name(EngineErrorCode::kNotFound),
                           "target not found in index: " + target));
    }
    if (!module.has_value()) {
      return ToolResult::err(engine_failure(module.error()));
    }
    out["kind"] = "module";
    out["overview"] = std::move(module.value());
  }

  if (depth == "deep") {
    auto arch = engine.query("getArchitecture", json{{"depth", 2}});
    if (!arch.has_value()) {
      return ToolResult::err(engine_failure(arch.error()));
    }
    out["architecture"] = std::move(arch.value());
  }
  return ToolResult::ok(std::move(out));
}

ToolResult handle_understand(catalog::ToolId /*id*/, const json& args, ServerContext& ctx) {
  const auto query = string_arg(args, "query");
  if (query.empty()) {
    return ToolResult::err(protocol_failure(protocol::kInvalidParams, "query is required"));
  }

  auto lease = ctx.engines.acquire();
  if (!lease.has_value()) {
    return ToolResult::err(pool_failure(lease.error()));
  }
  auto& engine = lease.value().engine();

  auto resolved = resolve_symbol(engine, query);
  if (!resolved.has_value()) {
    return ToolResult::err(engine_failure(resolved.error()));
  }

  json out{{"query", query}, {"symbol", resolved.value()["symbol"]}};
  if (bool_arg(args, "includeReferences", true)) {
    const auto symbol_id = out["symbol"].value("symbolId", std::string());
    auto refs = engine.query("findReferences", json{{"symbolId", symbol_id}, {"limit", 50}});
    if (!refs.has_value()) {
      return ToolResult::err(engine_failure(refs.error()));
    }
    out["references"] = std::move(refs.value());
  }
  return ToolResult::ok(std::move(out));
}

ToolResult handle_prepare_change(catalog::ToolId /*id*/, const json& args, ServerContext& ctx) {
  const auto target = string_arg(args, "target");
  if (target.empty()) {
    return ToolResult::err(protocol_failure(protocol::kInvalidParams, "target is required"));
  }
  const auto change_type = string_arg(args, "changeType", "modify");

  auto lease = ctx.engines.acquire();
  if (!lease.has_value()) {
    return ToolResult::err(pool_failure(lease.error()));
  }
  auto& engine = lease.value().engine();

  auto resolved = resolve_symbol(engine, target);
  if (!resolved.has_value()) {
    return ToolResult::err(engine_failure(resolved.error()));
  }
  const json symbol = resolved.value()["symbol"];

  auto refs = engine.query("findReferences",
                           json{{"symbolId", symbol.value("symbolId", std::string())}});
  if (!refs.has_value()) {
    return ToolResult::err(engine_failure(refs.error()));
  }

  std::set<std::string> files;
  for (const auto& ref : refs.value()["references"]) {
    files.insert(ref.value("filePath", std::string()));
  }
  const auto total = refs.value().value("totalReferences", static_cast<std::int64_t>(0));

  return ToolResult::ok(json{
      {"target", target},
      {"changeType", change_type},
      {"symbol", symbol},
      {"directReferences", total},
      {"affectedFiles", json(files)},
      {"riskLevel", risk_level(total, files.size())},
  });
}

}  // namespace ckmcp::mcp::handlers
