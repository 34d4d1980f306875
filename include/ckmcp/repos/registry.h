#pragma once

#include "ckmcp/core/result.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ckmcp::repos {

constexpr int kRegistryVersion = 1;

enum class RepoState {
  kValid,          // path exists and has an index directory
  kUninitialized,  // path exists, no index directory
  kMissing,        // path does not exist or is not a directory
};

[[nodiscard]] std::string_view repo_state_name(RepoState state);

struct RepoEntry {
  std::string name;  // NOLINT(readability-identifier-naming)
  std::string path;  // NOLINT(readability-identifier-naming)
};

// RepoRegistry is the read-only set of named repositories the server may switch between.
//
// File format:
//   {"version": 1, "default": "api", "repos": {"api": {"path": "/src/api"}, ...}}
class RepoRegistry {
 public:
  RepoRegistry() = default;

  // A missing file is an empty registry, not an error.
  [[nodiscard]] static core::Result<RepoRegistry, std::string> load(
      const std::filesystem::path& file);
  [[nodiscard]] static core::Result<RepoRegistry, std::string> from_json(
      const nlohmann::json& doc);

  [[nodiscard]] bool empty() const { return repos_.empty(); }
  [[nodiscard]] std::size_t size() const { return repos_.size(); }

  // Empty when no default is set.
  [[nodiscard]] const std::string& default_repo() const { return default_; }

  [[nodiscard]] std::optional<RepoEntry> get(std::string_view name) const;

  // Sorted by name.
  [[nodiscard]] std::vector<RepoEntry> list() const;

  // Filesystem check; computed on every call.
  [[nodiscard]] RepoState state_of(const RepoEntry& entry) const;

 private:
  std::map<std::string, RepoEntry, std::less<>> repos_;
  std::string default_;
};

// $CKMCP_HOME/repos.json, else $HOME/.ckmcp/repos.json.
[[nodiscard]] std::filesystem::path default_registry_path();

// true for "./x", "/abs", "a/b" or an existing directory; false for a bare registry name.
[[nodiscard]] bool looks_like_path(std::string_view value);

}  // namespace ckmcp::repos
