#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ckmcp::catalog {

// ToolKind separates compound tools, which aggregate several backend queries in one call,
// from granular tools that map onto a single query.
enum class ToolKind {
  kCompound,
  kGranular,
};

// ToolId is the closed set of tools this server can dispatch.
// Order here is declaration order only; display order comes from the preset filter.
enum class ToolId {
  // Compound
  kExplore,
  kUnderstand,
  kPrepareChange,
  kBatchGet,
  kBatchSearch,
  // Discovery & navigation
  kSearchSymbols,
  kGetSymbol,
  kExplainSymbol,
  kExplainFile,
  kFindReferences,
  kGetCallGraph,
  kTraceUsage,
  kListEntrypoints,
  kExplainPath,
  // Architecture
  kGetArchitecture,
  kGetModuleOverview,
  kListKeyConcepts,
  kGetModuleResponsibilities,
  // Impact & risk
  kAnalyzeImpact,
  kGetHotspots,
  kGetFileComplexity,
  // System
  kGetStatus,
  kExpandToolset,
  // Review
  kSummarizeDiff,
  kSummarizePr,
  kGetOwnership,
  kGetOwnershipDrift,
  kRecentlyRelevant,
  kScanSecrets,
  // Refactor
  kJustifySymbol,
  kAnalyzeCoupling,
  kFindDeadCodeCandidates,
  kFindDeadCode,
  kGetAffectedTests,
  kCompareApi,
  kAuditRisk,
  kExplainOrigin,
  // Decisions
  kRecordDecision,
  kGetDecisions,
  // Federation
  kListFederations,
  kFederationStatus,
  kFederationRepos,
  kFederationSearchModules,
  kFederationSearchOwnership,
  kFederationGetHotspots,
  kFederationSync,
  kFederationAddRemote,
  kFederationRemoveRemote,
  kFederationListRemote,
  kFederationSyncRemote,
  kFederationStatusRemote,
  kFederationSearchSymbolsHybrid,
  kFederationListAllRepos,
  // Docs
  kIndexDocs,
  kGetDocsForSymbol,
  kGetSymbolsInDoc,
  kGetDocsForModule,
  kCheckDocStaleness,
  kGetDocCoverage,
  // Ops
  kDoctor,
  kReindex,
  kDaemonStatus,
  kListJobs,
  kGetJobStatus,
  kCancelJob,
  kListSchedules,
  kRunSchedule,
  kListWebhooks,
  kTestWebhook,
  kWebhookDeliveries,
  kGetWideResultMetrics,
  // Multi-repo
  kListRepos,
  kSwitchRepo,
  kGetActiveRepo,

  kCount,  // NOLINT(readability-identifier-naming)
};

constexpr std::size_t kToolCount = static_cast<std::size_t>(ToolId::kCount);

// Tool is one entry of the catalog as advertised by tools/list.
// Identity is name; the catalog never holds two tools with the same name.
struct Tool {
  std::string name;             // NOLINT(readability-identifier-naming)
  std::string description;      // NOLINT(readability-identifier-naming)
  nlohmann::json input_schema;  // NOLINT(readability-identifier-naming)
  ToolKind kind{ToolKind::kGranular};  // NOLINT(readability-identifier-naming)
};

// Wire form: {"name", "description", "inputSchema"}.
[[nodiscard]] nlohmann::json tool_to_json(const Tool& tool);
[[nodiscard]] nlohmann::json tools_to_json(const std::vector<Tool>& tools);

}  // namespace ckmcp::catalog
