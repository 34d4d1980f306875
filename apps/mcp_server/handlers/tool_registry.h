#pragma once

#include <nlohmann/json.hpp>

#include "ckmcp/catalog/tool.h"
#include "ckmcp/core/result.h"
#include "ckmcp/engine/engine_provider.h"
#include "ckmcp/engine/query_engine.h"

#include "../server_context.h"
#include <array>
#include <string>
#include <string_view>

namespace ckmcp::mcp::handlers {

// ToolFailure is how a handler reports that a call did not succeed.
//
// kProtocol failures become a JSON-RPC error response (code/message/data).
// kBusiness failures are wrapped into the tool payload with isError set.
struct ToolFailure {
  enum class Kind { kProtocol, kBusiness };

  Kind kind{Kind::kBusiness};  // NOLINT(readability-identifier-naming)
  int rpc_code{0};             // NOLINT(readability-identifier-naming)
  std::string code;            // NOLINT(readability-identifier-naming)
  std::string message;         // NOLINT(readability-identifier-naming)
  nlohmann::json data;         // NOLINT(readability-identifier-naming)
};

using ToolResult = core::Result<nlohmann::json, ToolFailure>;

using ToolHandler = ToolResult (*)(catalog::ToolId id, const nlohmann::json& args,
                                   ServerContext& ctx);

struct ToolEntry {
  catalog::ToolId id;   // NOLINT(readability-identifier-naming)
  ToolHandler handler;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] ToolFailure protocol_failure(int rpc_code, std::string message,
                                           nlohmann::json data = nullptr);
[[nodiscard]] ToolFailure business_failure(std::string_view code, std::string message);

// Engine and pool errors mapped onto the two failure kinds.
[[nodiscard]] ToolFailure engine_failure(const engine::EngineError& error);
[[nodiscard]] ToolFailure pool_failure(const engine::PoolError& error);

// One entry per ToolId, indexed by the enum value.
[[nodiscard]] const std::array<ToolEntry, catalog::kToolCount>& tool_table();

[[nodiscard]] ToolResult call_tool(catalog::ToolId id, const nlohmann::json& args,
                                   ServerContext& ctx);

}  // namespace ckmcp::mcp::handlers
