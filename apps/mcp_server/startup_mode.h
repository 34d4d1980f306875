#pragma once

#include "ckmcp/core/result.h"
#include "ckmcp/repos/registry.h"

#include "config.h"
#include <filesystem>
#include <string>

namespace ckmcp::mcp {

enum class EngineMode {
  kSingle,     // legacy: one engine for one repository path
  kMultiRepo,  // engine pool backed by the repository registry
};

// StartupPlan is the resolved engine mode and initial repository.
struct StartupPlan {
  EngineMode mode{EngineMode::kSingle};  // NOLINT(readability-identifier-naming)
  std::string repo_name;                 // NOLINT(readability-identifier-naming)
  std::string repo_path;                 // NOLINT(readability-identifier-naming)
  std::string source;                    // NOLINT(readability-identifier-naming)
};

// plan_startup resolves --repo against the registry:
// - a value that looks like a path selects single-engine mode on that path
// - any other value must name a valid registry entry and selects multi-repo mode
// - without --repo, a valid registry default selects multi-repo mode; otherwise
//   single-engine mode on cwd
// registry may be nullptr when no registry could be loaded.
[[nodiscard]] core::Result<StartupPlan, std::string> plan_startup(
    const McpServerConfig& config, const repos::RepoRegistry* registry,
    const std::filesystem::path& cwd);

}  // namespace ckmcp::mcp
