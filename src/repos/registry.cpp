#include "ckmcp/repos/registry.h"

#include "ckmcp/engine/sqlite_query_engine.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace ckmcp::repos {

using json = nlohmann::json;

std::string_view repo_state_name(RepoState state) {
  switch (state) {
    case RepoState::kValid:
      return "valid";
    case RepoState::kUninitialized:
      return "uninitialized";
    case RepoState::kMissing:
      return "missing";
  }
  return "missing";
}

core::Result<RepoRegistry, std::string> RepoRegistry::load(const std::filesystem::path& file) {
  using R = core::Result<RepoRegistry, std::string>;

  std::error_code ec;
  if (!std::filesystem::exists(file, ec)) {
    return R::ok(RepoRegistry{});
  }

  std::ifstream in(file);
  if (!in) {
    return R::err("failed to read registry: " + file.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  const auto doc = json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    return R::err("failed to parse registry: " + file.string());
  }
  return from_json(doc);
}

core::Result<RepoRegistry, std::string> RepoRegistry::from_json(const json& doc) {
  using R = core::Result<RepoRegistry, std::string>;

  if (!doc.is_object()) {
    return R::err("registry must be a JSON object");
  }
  if (doc.contains("version") && doc["version"].is_number_integer() &&
      doc["version"].get<int>() > kRegistryVersion) {
    return R::err("registry version " + std::to_string(doc["version"].get<int>()) +
                  " not supported (max: " + std::to_string(kRegistryVersion) + ")");
  }

  RepoRegistry registry;
  if (doc.contains("repos")) {
    if (!doc["repos"].is_object()) {
      return R::err("registry 'repos' must be an object");
    }
    for (const auto& [name, entry] : doc["repos"].items()) {
      if (!entry.is_object() || !entry.contains("path") || !entry["path"].is_string()) {
        return R::err("registry entry '" + name + "' has no path");
      }
      registry.repos_.emplace(name, RepoEntry{.name = name, .path = entry["path"].get<std::string>()});
    }
  }
  if (doc.contains("default") && doc["default"].is_string()) {
    registry.default_ = doc["default"].get<std::string>();
  }
  return R::ok(std::move(registry));
}

std::optional<RepoEntry> RepoRegistry::get(std::string_view name) const {
  auto it = repos_.find(name);
  if (it == repos_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<RepoEntry> RepoRegistry::list() const {
  std::vector<RepoEntry> entries;
  entries.reserve(repos_.size());
  for (const auto& [name, entry] : repos_) {
    entries.push_back(entry);
  }
  return entries;
}

RepoState RepoRegistry::state_of(const RepoEntry& entry) const {
  std::error_code ec;
  const std::filesystem::path root(entry.path);
  if (!std::filesystem::is_directory(root, ec)) {
    return RepoState::kMissing;
  }
  if (!std::filesystem::is_directory(root / engine::kIndexDirName, ec)) {
    return RepoState::kUninitialized;
  }
  return RepoState::kValid;
}

std::filesystem::path default_registry_path() {
  if (const char* home = std::getenv("CKMCP_HOME"); home != nullptr && *home != '\0') {
    return std::filesystem::path(home) / "repos.json";
  }
  if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return std::filesystem::path(home) / engine::kIndexDirName / "repos.json";
  }
  return std::filesystem::path(engine::kIndexDirName) / "repos.json";
}

bool looks_like_path(std::string_view value) {
  if (value.find('/') != std::string_view::npos || value.find('\\') != std::string_view::npos) {
    return true;
  }
  if (!value.empty() && value.front() == '.') {
    return true;
  }
  std::error_code ec;
  return std::filesystem::is_directory(std::filesystem::path(std::string(value)), ec);
}

}  // namespace ckmcp::repos
