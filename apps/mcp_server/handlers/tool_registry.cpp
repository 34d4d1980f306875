#include "tool_registry.h"

#include "engine_tools.h"
#include "repo_tools.h"
#include "session_tools.h"

#include <cstddef>
#include <utility>

namespace ckmcp::mcp::handlers {

using catalog::ToolId;

namespace {

// Indexed by ToolId. Tools without a dedicated handler go straight to the engine.
constexpr std::array<ToolEntry, catalog::kToolCount> kToolTable{{
    {ToolId::kExplore, handle_explore},
    {ToolId::kUnderstand, handle_understand},
    {ToolId::kPrepareChange, handle_prepare_change},
    {ToolId::kBatchGet, handle_engine_query},
    {ToolId::kBatchSearch, handle_engine_query},
    {ToolId::kSearchSymbols, handle_engine_query},
    {ToolId::kGetSymbol, handle_engine_query},
    {ToolId::kExplainSymbol, handle_engine_query},
    {ToolId::kExplainFile, handle_engine_query},
    {ToolId::kFindReferences, handle_engine_query},
    {ToolId::kGetCallGraph, handle_engine_query},
    {ToolId::kTraceUsage, handle_engine_query},
    {ToolId::kListEntrypoints, handle_engine_query},
    {ToolId::kExplainPath, handle_engine_query},
    {ToolId::kGetArchitecture, handle_engine_query},
    {ToolId::kGetModuleOverview, handle_engine_query},
    {ToolId::kListKeyConcepts, handle_engine_query},
    {ToolId::kGetModuleResponsibilities, handle_engine_query},
    {ToolId::kAnalyzeImpact, handle_engine_query},
    {ToolId::kGetHotspots, handle_engine_query},
    {ToolId::kGetFileComplexity, handle_engine_query},
    {ToolId::kGetStatus, handle_get_status},
    {ToolId::kExpandToolset, handle_expand_toolset},
    {ToolId::kSummarizeDiff, handle_engine_query},
    {ToolId::kSummarizePr, handle_engine_query},
    {ToolId::kGetOwnership, handle_engine_query},
    {ToolId::kGetOwnershipDrift, handle_engine_query},
    {ToolId::kRecentlyRelevant, handle_engine_query},
    {ToolId::kScanSecrets, handle_engine_query},
    {ToolId::kJustifySymbol, handle_engine_query},
    {ToolId::kAnalyzeCoupling, handle_engine_query},
    {ToolId::kFindDeadCodeCandidates, handle_engine_query},
    {ToolId::kFindDeadCode, handle_engine_query},
    {ToolId::kGetAffectedTests, handle_engine_query},
    {ToolId::kCompareApi, handle_engine_query},
    {ToolId::kAuditRisk, handle_engine_query},
    {ToolId::kExplainOrigin, handle_engine_query},
    {ToolId::kRecordDecision, handle_engine_query},
    {ToolId::kGetDecisions, handle_engine_query},
    {ToolId::kListFederations, handle_engine_query},
    {ToolId::kFederationStatus, handle_engine_query},
    {ToolId::kFederationRepos, handle_engine_query},
    {ToolId::kFederationSearchModules, handle_engine_query},
    {ToolId::kFederationSearchOwnership, handle_engine_query},
    {ToolId::kFederationGetHotspots, handle_engine_query},
    {ToolId::kFederationSync, handle_engine_query},
    {ToolId::kFederationAddRemote, handle_engine_query},
    {ToolId::kFederationRemoveRemote, handle_engine_query},
    {ToolId::kFederationListRemote, handle_engine_query},
    {ToolId::kFederationSyncRemote, handle_engine_query},
    {ToolId::kFederationStatusRemote, handle_engine_query},
    {ToolId::kFederationSearchSymbolsHybrid, handle_engine_query},
    {ToolId::kFederationListAllRepos, handle_engine_query},
    {ToolId::kIndexDocs, handle_engine_query},
    {ToolId::kGetDocsForSymbol, handle_engine_query},
    {ToolId::kGetSymbolsInDoc, handle_engine_query},
    {ToolId::kGetDocsForModule, handle_engine_query},
    {ToolId::kCheckDocStaleness, handle_engine_query},
    {ToolId::kGetDocCoverage, handle_engine_query},
    {ToolId::kDoctor, handle_engine_query},
    {ToolId::kReindex, handle_engine_query},
    {ToolId::kDaemonStatus, handle_engine_query},
    {ToolId::kListJobs, handle_engine_query},
    {ToolId::kGetJobStatus, handle_engine_query},
    {ToolId::kCancelJob, handle_engine_query},
    {ToolId::kListSchedules, handle_engine_query},
    {ToolId::kRunSchedule, handle_engine_query},
    {ToolId::kListWebhooks, handle_engine_query},
    {ToolId::kTestWebhook, handle_engine_query},
    {ToolId::kWebhookDeliveries, handle_engine_query},
    {ToolId::kGetWideResultMetrics, handle_engine_query},
    {ToolId::kListRepos, handle_list_repos},
    {ToolId::kSwitchRepo, handle_switch_repo},
    {ToolId::kGetActiveRepo, handle_get_active_repo},
}};

constexpr bool table_matches_ids() {
  for (std::size_t i = 0; i < kToolTable.size(); ++i) {
    if (kToolTable[i].id != static_cast<ToolId>(i) || kToolTable[i].handler == nullptr) {
      return false;
    }
  }
  return true;
}

static_assert(kToolTable.size() == catalog::kToolCount);
static_assert(table_matches_ids(), "tool table must list every ToolId in declaration order");

}  // namespace

ToolFailure protocol_failure(int rpc_code, std::string message, nlohmann::json data) {
  return ToolFailure{
      .kind = ToolFailure::Kind::kProtocol,
      .rpc_code = rpc_code,
      .code = "",
      .message = std::move(message),
      .data = std::move(data),
  };
}

ToolFailure business_failure(std::string_view code, std::string message) {
  return ToolFailure{
      .kind = ToolFailure::Kind::kBusiness,
      .rpc_code = 0,
      .code = std::string(code),
      .message = std::move(message),
      .data = nullptr,
  };
}

ToolFailure engine_failure(const engine::EngineError& error) {
  if (error.code == engine::EngineErrorCode::kInvalidArguments) {
    return protocol_failure(protocol::kInvalidParams, error.message);
  }
  return business_failure(engine::engine_error_code_name(error.code), error.message);
}

ToolFailure pool_failure(const engine::PoolError& error) {
  switch (error.code) {
    case engine::PoolErrorCode::kExhausted:
      return protocol_failure(
          protocol::kInternalError, error.message,
          nlohmann::json{{"code", std::string(engine::pool_error_code_name(error.code))},
                         {"retryable", true}});
    case engine::PoolErrorCode::kUnsupported:
      return protocol_failure(protocol::kInvalidRequest, error.message);
    case engine::PoolErrorCode::kNoActiveRepo:
    case engine::PoolErrorCode::kOpenFailed:
      break;
  }
  return business_failure(engine::pool_error_code_name(error.code), error.message);
}

const std::array<ToolEntry, catalog::kToolCount>& tool_table() {
  return kToolTable;
}

ToolResult call_tool(ToolId id, const nlohmann::json& args, ServerContext& ctx) {
  const auto index = static_cast<std::size_t>(id);
  if (index >= kToolTable.size()) {
    return ToolResult::err(protocol_failure(protocol::kNotFound, "Tool not found"));
  }
  return kToolTable[index].handler(id, args, ctx);
}

}  // namespace ckmcp::mcp::handlers
