#include "startup_mode.h"

#include <optional>

namespace ckmcp::mcp {

core::Result<StartupPlan, std::string> plan_startup(const McpServerConfig& config,
                                                    const repos::RepoRegistry* registry,
                                                    const std::filesystem::path& cwd) {
  using R = core::Result<StartupPlan, std::string>;

  if (config.repo.has_value()) {
    const auto& repo = config.repo.value();
    if (repos::looks_like_path(repo)) {
      return R::ok(StartupPlan{
          .mode = EngineMode::kSingle,
          .repo_name = std::filesystem::path(repo).filename().string(),
          .repo_path = repo,
          .source = "path",
      });
    }

    std::optional<repos::RepoEntry> entry;
    if (registry != nullptr) {
      entry = registry->get(repo);
    }
    if (!entry.has_value()) {
      return R::err("repository '" + repo + "' not found in registry");
    }
    const auto state = registry->state_of(entry.value());
    if (state != repos::RepoState::kValid) {
      return R::err("repository '" + repo + "' is " + std::string(repos::repo_state_name(state)));
    }
    return R::ok(StartupPlan{
        .mode = EngineMode::kMultiRepo,
        .repo_name = entry->name,
        .repo_path = entry->path,
        .source = "registry",
    });
  }

  if (registry != nullptr && !registry->default_repo().empty()) {
    const auto entry = registry->get(registry->default_repo());
    if (entry.has_value() && registry->state_of(entry.value()) == repos::RepoState::kValid) {
      return R::ok(StartupPlan{
          .mode = EngineMode::kMultiRepo,
          .repo_name = entry->name,
          .repo_path = entry->path,
          .source = "default",
      });
    }
  }

  return R::ok(StartupPlan{
      .mode = EngineMode::kSingle,
      .repo_name = cwd.filename().string(),
      .repo_path = cwd.string(),
      .source = "current directory",
  });
}

}  // namespace ckmcp::mcp
