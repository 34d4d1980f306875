#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ckmcp::session {

// Root is a filesystem boundary declared by the client through roots/list.
struct Root {
  std::string uri;   // NOLINT(readability-identifier-naming)
  std::string name;  // NOLINT(readability-identifier-naming)

  // Filesystem path for a file:// URI (percent-decoded). Other URIs are returned as-is.
  [[nodiscard]] std::string path() const;
};

// Roots-related client capabilities from initialize params.
struct ClientCapabilities {
  bool roots{false};               // NOLINT(readability-identifier-naming)
  bool roots_list_changed{false};  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] ClientCapabilities parse_client_capabilities(const nlohmann::json& params);

// A root URI must be file:// with an empty host and an absolute path free of "..".
[[nodiscard]] bool is_valid_root_uri(std::string_view uri);

// parse_roots_result reads {"roots": [{uri, name?}, ...]}. Entries that are not objects or
// carry an invalid URI are skipped. nullopt when the result has no roots array at all.
[[nodiscard]] std::optional<std::vector<Root>> parse_roots_result(const nlohmann::json& result);

[[nodiscard]] nlohmann::json roots_to_json(const std::vector<Root>& roots);

}  // namespace ckmcp::session
