#pragma once

#include "ckmcp/catalog/presets.h"
#include "ckmcp/engine/engine_pool.h"
#include "ckmcp/pagination/paginator.h"
#include "ckmcp/protocol/jsonrpc.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace ckmcp::mcp {

constexpr std::int64_t kDefaultRootsTimeoutMs = 10000;

// McpServerConfig holds all parsed startup flags for the MCP server.
// Every field has an explicit default; optional fields mean "not configured".
struct McpServerConfig {
  // Repository path (legacy single-engine mode) or registry name (multi-repo mode).
  std::optional<std::string> repo;           // NOLINT(readability-identifier-naming)
  std::optional<std::string> registry_path;  // NOLINT(readability-identifier-naming)
  std::string preset{catalog::kDefaultPreset};  // NOLINT(readability-identifier-naming)
  int page_size{pagination::kDefaultPageSize};  // NOLINT(readability-identifier-naming)
  std::size_t max_engines{engine::kDefaultMaxEngines};  // NOLINT(readability-identifier-naming)
  std::int64_t roots_timeout_ms{kDefaultRootsTimeoutMs};  // NOLINT(readability-identifier-naming)
  std::size_t max_message_bytes{protocol::kMaxMessageSize};  // NOLINT(readability-identifier-naming)
  bool list_presets{false};  // NOLINT(readability-identifier-naming)
  // Set when any flag failed to parse; validation reports it.
  std::optional<std::string> parse_error;  // NOLINT(readability-identifier-naming)
};

McpServerConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

}  // namespace ckmcp::mcp
