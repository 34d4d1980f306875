#include "ckmcp/catalog/catalog.h"
#include "ckmcp/catalog/presets.h"
#include "ckmcp/core/clock.h"
#include "ckmcp/core/version.h"
#include "ckmcp/engine/engine_pool.h"
#include "ckmcp/engine/single_engine_provider.h"
#include "ckmcp/engine/sqlite_query_engine.h"
#include "ckmcp/repos/registry.h"
#include "ckmcp/session/session.h"

#include "config.h"
#include "message_writer.h"
#include "roots_exchange.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include "startup_mode.h"
#include <chrono>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

using namespace ckmcp;

namespace {

// ────────────────────────────────────────────────────────────────
// --list-presets
// ────────────────────────────────────────────────────────────────

void print_presets(std::ostream& out) {
  out << "\nAvailable presets:\n\n";
  out << "  " << std::left << std::setw(12) << "PRESET" << " " << std::right << std::setw(6)
      << "TOOLS" << " " << std::setw(14) << "TOKENS" << "  DESCRIPTION\n";
  out << "  " << std::left << std::setw(12) << "------" << " " << std::right << std::setw(6)
      << "-----" << " " << std::setw(14) << "------" << "  -----------\n";

  for (const auto& info : catalog::all_preset_info(catalog::tool_catalog())) {
    out << "  " << std::left << std::setw(12) << info.name << " " << std::right << std::setw(6)
        << info.tool_count << " " << std::setw(14) << catalog::format_tokens(info.token_count)
        << "  " << info.description << (info.is_default ? " (default)" : "") << "\n";
  }
  out << "\nUse: ckmcp_mcp_server --preset <name>\n\n";
}

core::Result<std::shared_ptr<engine::IQueryEngine>, std::string> open_engine(
    const std::string& repo_path) {
  using R = core::Result<std::shared_ptr<engine::IQueryEngine>, std::string>;
  auto opened = engine::SqliteQueryEngine::open(repo_path);
  if (!opened.has_value()) {
    return R::err(opened.error());
  }
  return R::ok(opened.value());
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  auto config = mcp::parse_args(argc, argv);

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = mcp::validate_mcp_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  if (config.list_presets) {
    print_presets(std::cout);
    return 0;
  }

  // ── Repository registry ───────────────────────────────────────────────────
  const auto registry_file = config.registry_path.has_value()
                                 ? std::filesystem::path(config.registry_path.value())
                                 : repos::default_registry_path();
  std::optional<repos::RepoRegistry> registry;
  {
    auto loaded = repos::RepoRegistry::load(registry_file);
    if (loaded.has_value()) {
      registry = std::move(loaded.value());
    } else if (config.registry_path.has_value()) {
      std::cerr << "Error: " << loaded.error() << "\n";
      return 1;
    } else {
      std::cerr << "WARNING: " << loaded.error() << "\n"
                << "         Continuing without a repository registry.\n";
    }
  }

  std::error_code cwd_error;
  const auto cwd = std::filesystem::current_path(cwd_error);
  if (cwd_error) {
    std::cerr << "Error: cannot resolve current directory: " << cwd_error.message() << "\n";
    return 1;
  }
  auto plan = mcp::plan_startup(config, registry.has_value() ? &registry.value() : nullptr, cwd);
  if (!plan.has_value()) {
    std::cerr << "Error: " << plan.error() << "\n";
    return 1;
  }
  const auto& startup = plan.value();

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "Repository:  " << startup.repo_name << " (" << startup.repo_path << ") ["
            << startup.source << "]\n";

  core::SystemClock clock;
  std::unique_ptr<engine::IEngineProvider> engines;
  const repos::RepoRegistry* active_registry = nullptr;

  switch (startup.mode) {
    case mcp::EngineMode::kSingle: {
      auto opened = open_engine(startup.repo_path);
      if (!opened.has_value()) {
        std::cerr << "Error: failed to open repository index: " << opened.error() << "\n";
        return 1;
      }
      engines = std::make_unique<engine::SingleEngineProvider>(opened.value(), startup.repo_path,
                                                               clock);
      std::cerr << "Engines:     single (legacy mode)\n";
      if (registry.has_value() && !registry->empty()) {
        std::cerr << "WARNING: Registry has " << registry->size()
                  << " repositories but single-engine mode was selected.\n"
                     "         listRepos/switchRepo are disabled for this session.\n";
      }
      break;
    }
    case mcp::EngineMode::kMultiRepo: {
      auto pool = std::make_unique<engine::EnginePool>(open_engine, clock, config.max_engines);
      pool->set_eviction_listener([](const engine::EngineInfo& info) {
        std::cerr << "Evicted idle engine: " << info.repo_name << " (" << info.repo_path
                  << "), idle " << info.idle_ms << "ms\n";
      });
      auto switched = pool->switch_active(startup.repo_name, startup.repo_path);
      if (!switched.has_value()) {
        std::cerr << "Error: failed to open repository index: " << switched.error().message
                  << "\n";
        return 1;
      }
      engines = std::move(pool);
      active_registry = &registry.value();
      std::cerr << "Engines:     pool (multi-repo, max " << config.max_engines << ")\n"
                << "Registry:    " << registry_file.string() << " (" << registry->size()
                << " repositories)\n";
      break;
    }
  }

  session::Session session(catalog::tool_catalog(), config.preset);

  const auto toolset = session.toolset();
  const auto total = session.catalog_size();
  const auto exposed = toolset.tools.size();
  std::cerr << "\n"
            << "ckmcp MCP Server v" << core::kBuildVersion << "\n"
            << "  Active tools: " << exposed << " / " << total << " ("
            << (total == 0 ? 0 : exposed * 100 / total) << "%)\n"
            << "  Estimated context: "
            << catalog::format_tokens(catalog::estimate_tokens(toolset.tools)) << "\n"
            << "  Preset: " << toolset.preset << "\n"
            << "  Page size: " << config.page_size << "\n\n";

  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  mcp::MessageWriter writer(std::cout);
  mcp::RootsExchange roots(session, writer, std::chrono::milliseconds(config.roots_timeout_ms));

  try {
    mcp::ServerContext ctx{session, *engines, active_registry, roots, writer, clock, config};
    mcp::run_server_loop(ctx, std::cin);
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
