#pragma once

#include "ckmcp/catalog/tool.h"

#include <optional>
#include <string_view>
#include <vector>

namespace ckmcp::catalog {

// tool_catalog returns the full, ordered tool catalog.
// The catalog is built once on first use and never changes for the life of the process.
[[nodiscard]] const std::vector<Tool>& tool_catalog();

// Name <-> id mapping for the closed ToolId set.
[[nodiscard]] std::string_view tool_name(ToolId id);
[[nodiscard]] std::optional<ToolId> find_tool_id(std::string_view name);

}  // namespace ckmcp::catalog
