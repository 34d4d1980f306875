#include "ckmcp/catalog/catalog.h"

#include <array>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>

namespace ckmcp::catalog {

using json = nlohmann::json;

namespace {

// ────────────────────────────────────────────────────────────────
// Names
// ────────────────────────────────────────────────────────────────

constexpr std::array<std::string_view, kToolCount> kToolNames = {
    "explore",
    "understand",
    "prepareChange",
    "batchGet",
    "batchSearch",
    "searchSymbols",
    "getSymbol",
    "explainSymbol",
    "explainFile",
    "findReferences",
    "getCallGraph",
    "traceUsage",
    "listEntrypoints",
    "explainPath",
    "getArchitecture",
    "getModuleOverview",
    "listKeyConcepts",
    "getModuleResponsibilities",
    "analyzeImpact",
    "getHotspots",
    "getFileComplexity",
    "getStatus",
    "expandToolset",
    "summarizeDiff",
    "summarizePr",
    "getOwnership",
    "getOwnershipDrift",
    "recentlyRelevant",
    "scanSecrets",
    "justifySymbol",
    "analyzeCoupling",
    "findDeadCodeCandidates",
    "findDeadCode",
    "getAffectedTests",
    "compareAPI",
    "auditRisk",
    "explainOrigin",
    "recordDecision",
    "getDecisions",
    "listFederations",
    "federationStatus",
    "federationRepos",
    "federationSearchModules",
    "federationSearchOwnership",
    "federationGetHotspots",
    "federationSync",
    "federationAddRemote",
    "federationRemoveRemote",
    "federationListRemote",
    "federationSyncRemote",
    "federationStatusRemote",
    "federationSearchSymbolsHybrid",
    "federationListAllRepos",
    "indexDocs",
    "getDocsForSymbol",
    "getSymbolsInDoc",
    "getDocsForModule",
    "checkDocStaleness",
    "getDocCoverage",
    "doctor",
    "reindex",
    "daemonStatus",
    "listJobs",
    "getJobStatus",
    "cancelJob",
    "listSchedules",
    "runSchedule",
    "listWebhooks",
    "testWebhook",
    "webhookDeliveries",
    "getWideResultMetrics",
    "listRepos",
    "switchRepo",
    "getActiveRepo",
};

constexpr bool all_named(const std::array<std::string_view, kToolCount>& names) {
  for (const auto name : names) {
    if (name.empty()) {
      return false;
    }
  }
  return true;
}

static_assert(all_named(kToolNames), "every ToolId needs a wire name");

// ────────────────────────────────────────────────────────────────
// Schema helpers
// ────────────────────────────────────────────────────────────────

json prop(const char* type, const char* description) {
  return json{{"type", type}, {"description", description}};
}

json enum_prop(std::initializer_list<const char*> values, const char* fallback,
               const char* description) {
  json values_json = json::array();
  for (const char* v : values) {
    values_json.push_back(v);
  }
  return json{
      {"type", "string"},
      {"enum", values_json},
      {"default", fallback},
      {"description", description},
  };
}

json array_prop(const char* item_type, const char* description) {
  return json{{"type", "array"}, {"items", {{"type", item_type}}}, {"description", description}};
}

json object_schema(std::initializer_list<std::pair<const char*, json>> properties = {},
                   std::initializer_list<const char*> required = {}) {
  json props = json::object();
  for (const auto& [name, schema] : properties) {
    props[name] = schema;
  }
  json schema{{"type", "object"}, {"properties", props}};
  if (required.size() > 0) {
    json req = json::array();
    for (const char* r : required) {
      req.push_back(r);
    }
    schema["required"] = req;
  }
  return schema;
}

json symbol_id() {
  return prop("string", "The stable symbol ID");
}

json limit(int fallback, const char* description) {
  return json{{"type", "number"}, {"default", fallback}, {"description", description}};
}

Tool granular(ToolId id, const char* description, json schema) {
  return Tool{
      .name = std::string(kToolNames[static_cast<std::size_t>(id)]),
      .description = description,
      .input_schema = std::move(schema),
      .kind = ToolKind::kGranular,
  };
}

Tool compound(ToolId id, const char* description, json schema) {
  Tool tool = granular(id, description, std::move(schema));
  tool.kind = ToolKind::kCompound;
  return tool;
}

// ────────────────────────────────────────────────────────────────
// Descriptors
// ────────────────────────────────────────────────────────────────

// No default branch: a ToolId without a descriptor is a -Wswitch diagnostic.
Tool describe(ToolId id) {
  switch (id) {
    case ToolId::kExplore:
      return compound(id,
                      "Explore a file, directory, or module: structure, key symbols, hotspots "
                      "and call relationships in one call",
                      object_schema({{"target", prop("string", "File, directory, or module path")},
                                     {"depth", enum_prop({"shallow", "standard", "deep"},
                                                         "standard", "Amount of detail")}},
                                    {"target"}));
    case ToolId::kUnderstand:
      return compound(id,
                      "Understand a symbol: resolve it, explain it, and list references and "
                      "callers in one call",
                      object_schema({{"query", prop("string", "Symbol name or stable ID")},
                                     {"includeReferences",
                                      prop("boolean", "Include reference locations")},
                                     {"includeCallGraph", prop("boolean", "Include call graph")}},
                                    {"query"}));
    case ToolId::kPrepareChange:
      return compound(id,
                      "Prepare a change to a symbol: impact, affected tests, coupling and risk in "
                      "one call",
                      object_schema({{"target", prop("string", "Symbol ID or file path")},
                                     {"changeType",
                                      enum_prop({"modify", "rename", "delete", "extract"},
                                                "modify", "Kind of change being planned")}},
                                    {"target"}));
    case ToolId::kBatchGet:
      return compound(id, "Fetch several symbols by stable ID in one call",
                      object_schema({{"symbolIds", array_prop("string", "Stable symbol IDs (max 50)")}},
                                    {"symbolIds"}));
    case ToolId::kBatchSearch:
      return compound(id, "Run several symbol searches in one call",
                      object_schema({{"queries", json{{"type", "array"},
                                                      {"items", object_schema(
                                                                    {{"query", prop("string", "Search query")},
                                                                     {"kind", prop("string", "Symbol kind filter")},
                                                                     {"limit", limit(10, "Max results")}},
                                                                    {"query"})},
                                                      {"description", "Searches to run (max 10)"}}}},
                                    {"queries"}));
    case ToolId::kSearchSymbols:
      return granular(
          id, "Search for symbols by name with optional filtering",
          object_schema({{"query", prop("string", "Search query (substring match, case-insensitive)")},
                         {"scope", prop("string", "Optional module ID to limit search scope")},
                         {"kinds", array_prop("string", "Symbol kinds to include (e.g. 'class', 'function')")},
                         {"limit", limit(20, "Maximum number of results to return")}},
                        {"query"}));
    case ToolId::kGetSymbol:
      return granular(id, "Get symbol metadata and location by stable ID",
                      object_schema({{"symbolId", symbol_id()},
                                     {"repoStateMode",
                                      enum_prop({"head", "full"}, "head",
                                                "Use HEAD commit only or the full working tree")}},
                                    {"symbolId"}));
    case ToolId::kExplainSymbol:
      return granular(id, "Explain a symbol with usage, history, and summary",
                      object_schema({{"symbolId", symbol_id()}}, {"symbolId"}));
    case ToolId::kExplainFile:
      return granular(id, "Summarize a file: role, defined symbols, key imports and recent changes",
                      object_schema({{"filePath", prop("string", "Repository-relative file path")}},
                                    {"filePath"}));
    case ToolId::kFindReferences:
      return granular(id, "Find all references to a symbol with completeness information",
                      object_schema({{"symbolId", symbol_id()},
                                     {"scope", prop("string", "Optional module ID to limit search scope")},
                                     {"merge", enum_prop({"prefer-first", "union"}, "prefer-first",
                                                         "Backend merge strategy")},
                                     {"limit", limit(100, "Maximum number of references to return")}},
                                    {"symbolId"}));
    case ToolId::kGetCallGraph:
      return granular(id, "Return a lightweight call graph rooted at a symbol",
                      object_schema({{"symbolId", symbol_id()},
                                     {"direction", enum_prop({"callers", "callees", "both"}, "both",
                                                             "Edges to follow")},
                                     {"depth", limit(1, "Traversal depth (1-4)")}},
                                    {"symbolId"}));
    case ToolId::kTraceUsage:
      return granular(id, "Trace how a symbol is reached from entrypoints",
                      object_schema({{"symbolId", symbol_id()},
                                     {"maxPaths", limit(10, "Maximum number of paths to return")}},
                                    {"symbolId"}));
    case ToolId::kListEntrypoints:
      return granular(id, "List system entrypoints: main functions, handlers, CLI commands",
                      object_schema({{"moduleFilter", prop("string", "Only include this module")},
                                     {"limit", limit(30, "Maximum number of entrypoints")}}));
    case ToolId::kExplainPath:
      return granular(id, "Explain the role of a path from its location and naming",
                      object_schema({{"filePath", prop("string", "Repository-relative path")}},
                                    {"filePath"}));
    case ToolId::kGetArchitecture:
      return granular(id, "Get codebase architecture with module dependencies",
                      object_schema({{"depth", limit(2, "Maximum dependency depth to traverse")},
                                     {"includeExternalDeps",
                                      prop("boolean", "Include external dependencies")}}));
    case ToolId::kGetModuleOverview:
      return granular(id, "Basic module overview including size and recent commits",
                      object_schema({{"path", prop("string", "Module path")},
                                     {"name", prop("string", "Optional display name")}}));
    case ToolId::kListKeyConcepts:
      return granular(id, "List the main domain concepts found in names and comments",
                      object_schema({{"limit", limit(12, "Maximum number of concepts")}}));
    case ToolId::kGetModuleResponsibilities:
      return granular(id, "Describe what each module is responsible for",
                      object_schema({{"moduleId", prop("string", "Optional module to describe")},
                                     {"limit", limit(20, "Maximum number of modules")}}));
    case ToolId::kAnalyzeImpact:
      return granular(id, "Analyze the impact of changing a symbol",
                      object_schema({{"symbolId", symbol_id()},
                                     {"depth", limit(2, "Maximum transitive depth")}},
                                    {"symbolId"}));
    case ToolId::kGetHotspots:
      return granular(id, "Find files with high churn and complexity",
                      object_schema({{"timeWindow", prop("string", "Window such as '30d' or '6m'")},
                                     {"scope", prop("string", "Optional module path")},
                                     {"limit", limit(20, "Maximum number of hotspots")}}));
    case ToolId::kGetFileComplexity:
      return granular(id, "Cyclomatic and cognitive complexity for a file",
                      object_schema({{"filePath", prop("string", "Repository-relative file path")}},
                                    {"filePath"}));
    case ToolId::kGetStatus:
      return granular(id,
                      "Get server status including active preset, repository, loaded engines and "
                      "index health",
                      object_schema());
    case ToolId::kExpandToolset:
      return granular(id,
                      "Switch to a larger tool preset. Allowed once per session; call only when "
                      "the current tools cannot complete the task",
                      object_schema({{"preset", enum_prop({"review", "refactor", "federation",
                                                           "docs", "ops", "full"},
                                                          "full", "Preset to switch to")},
                                     {"reason", prop("string", "Why the extra tools are needed")}},
                                    {"preset", "reason"}));
    case ToolId::kSummarizeDiff:
      return granular(id, "Summarize changes between two commits or in a commit range",
                      object_schema({{"commitRange", json{{"type", "object"},
                                                          {"properties",
                                                           {{"base", {{"type", "string"}}},
                                                            {"head", {{"type", "string"}}}}}}},
                                     {"commit", prop("string", "Single commit to summarize")},
                                     {"timeWindow", prop("string", "Window such as '7d'")}}));
    case ToolId::kSummarizePr:
      return granular(id, "Summarize a pull request branch: changed modules, risk and reviewers",
                      object_schema({{"baseBranch", prop("string", "Base branch (default main)")},
                                     {"headBranch", prop("string", "Head branch (default HEAD)")}}));
    case ToolId::kGetOwnership:
      return granular(id, "Get owners of a file or module from CODEOWNERS and git blame",
                      object_schema({{"path", prop("string", "File or directory path")},
                                     {"includeHistory", prop("boolean", "Include ownership history")}},
                                    {"path"}));
    case ToolId::kGetOwnershipDrift:
      return granular(id, "Compare declared owners against actual contributors",
                      object_schema({{"scope", prop("string", "Optional module path")},
                                     {"threshold", json{{"type", "number"},
                                                        {"default", 0.3},
                                                        {"description", "Minimum drift score"}}}}));
    case ToolId::kRecentlyRelevant:
      return granular(id, "List symbols and files that changed recently and matter most",
                      object_schema({{"timeWindow", prop("string", "Window such as '7d'")},
                                     {"moduleFilter", prop("string", "Only include this module")}}));
    case ToolId::kScanSecrets:
      return granular(id, "Scan files for committed secrets and credentials",
                      object_schema({{"scope", prop("string", "Path to scan (default: repository)")},
                                     {"minSeverity", enum_prop({"low", "medium", "high", "critical"},
                                                               "medium", "Minimum severity")}}));
    case ToolId::kJustifySymbol:
      return granular(id, "Provide a keep/investigate/remove style verdict",
                      object_schema({{"symbolId", symbol_id()}}, {"symbolId"}));
    case ToolId::kAnalyzeCoupling:
      return granular(id, "Find files that change together with a target file",
                      object_schema({{"target", prop("string", "File path")},
                                     {"minCorrelation", json{{"type", "number"},
                                                             {"default", 0.3},
                                                             {"description", "Minimum co-change ratio"}}}},
                                    {"target"}));
    case ToolId::kFindDeadCodeCandidates:
      return granular(id, "List symbols with no observed usage (candidates, not verdicts)",
                      object_schema({{"scope", prop("string", "Optional module path")},
                                     {"limit", limit(50, "Maximum number of candidates")}}));
    case ToolId::kFindDeadCode:
      return granular(id, "Static dead code detection from the reference graph",
                      object_schema({{"scope", prop("string", "Optional module path")},
                                     {"includeExported", prop("boolean", "Include exported symbols")}}));
    case ToolId::kGetAffectedTests:
      return granular(id, "Find tests affected by changes to files or symbols",
                      object_schema({{"files", array_prop("string", "Changed files")},
                                     {"symbolIds", array_prop("string", "Changed symbols")}}));
    case ToolId::kCompareApi:
      return granular(id, "Detect breaking API changes between two refs",
                      object_schema({{"baseRef", prop("string", "Base ref (default HEAD~1)")},
                                     {"targetRef", prop("string", "Target ref (default HEAD)")}}));
    case ToolId::kAuditRisk:
      return granular(id, "Rank files by combined risk signals",
                      object_schema({{"minScore", limit(40, "Minimum risk score")},
                                     {"limit", limit(50, "Maximum number of files")}}));
    case ToolId::kExplainOrigin:
      return granular(id, "Explain why a symbol exists: introducing commit, authors and evolution",
                      object_schema({{"symbol", prop("string", "Symbol name or stable ID")}},
                                    {"symbol"}));
    case ToolId::kRecordDecision:
      return granular(id, "Record an architectural decision",
                      object_schema({{"title", prop("string", "Decision title")},
                                     {"context", prop("string", "Background")},
                                     {"decision", prop("string", "What was decided")},
                                     {"affectedModules", array_prop("string", "Modules affected")}},
                                    {"title", "context", "decision"}));
    case ToolId::kGetDecisions:
      return granular(id, "List recorded architectural decisions",
                      object_schema({{"moduleId", prop("string", "Only decisions for this module")},
                                     {"status", prop("string", "Status filter")}}));
    case ToolId::kListFederations:
      return granular(id, "List configured federations", object_schema());
    case ToolId::kFederationStatus:
      return granular(id, "Status of a federation and its member repositories",
                      object_schema({{"federation", prop("string", "Federation name")}},
                                    {"federation"}));
    case ToolId::kFederationRepos:
      return granular(id, "List repositories in a federation",
                      object_schema({{"federation", prop("string", "Federation name")}},
                                    {"federation"}));
    case ToolId::kFederationSearchModules:
      return granular(id, "Search modules across a federation",
                      object_schema({{"federation", prop("string", "Federation name")},
                                     {"query", prop("string", "Module name query")}},
                                    {"federation"}));
    case ToolId::kFederationSearchOwnership:
      return granular(id, "Search ownership across a federation",
                      object_schema({{"federation", prop("string", "Federation name")},
                                     {"path", prop("string", "Path glob")}},
                                    {"federation"}));
    case ToolId::kFederationGetHotspots:
      return granular(id, "Hotspots merged across a federation",
                      object_schema({{"federation", prop("string", "Federation name")},
                                     {"limit", limit(20, "Maximum number of hotspots")}},
                                    {"federation"}));
    case ToolId::kFederationSync:
      return granular(id, "Refresh the federation index from member repositories",
                      object_schema({{"federation", prop("string", "Federation name")},
                                     {"force", prop("boolean", "Sync even if fresh")}},
                                    {"federation"}));
    case ToolId::kFederationAddRemote:
      return granular(id, "Add a remote index server to a federation",
                      object_schema({{"federation", prop("string", "Federation name")},
                                     {"name", prop("string", "Remote name")},
                                     {"url", prop("string", "Remote server URL")}},
                                    {"federation", "name", "url"}));
    case ToolId::kFederationRemoveRemote:
      return granular(id, "Remove a remote index server from a federation",
                      object_schema({{"federation", prop("string", "Federation name")},
                                     {"name", prop("string", "Remote name")}},
                                    {"federation", "name"}));
    case ToolId::kFederationListRemote:
      return granular(id, "List remote index servers of a federation",
                      object_schema({{"federation", prop("string", "Federation name")}},
                                    {"federation"}));
    case ToolId::kFederationSyncRemote:
      return granular(id, "Sync metadata from remote index servers",
                      object_schema({{"federation", prop("string", "Federation name")},
                                     {"name", prop("string", "Only this remote")}},
                                    {"federation"}));
    case ToolId::kFederationStatusRemote:
      return granular(id, "Health of remote index servers",
                      object_schema({{"federation", prop("string", "Federation name")}},
                                    {"federation"}));
    case ToolId::kFederationSearchSymbolsHybrid:
      return granular(id, "Search symbols across local and remote federation members",
                      object_schema({{"federation", prop("string", "Federation name")},
                                     {"query", prop("string", "Search query")},
                                     {"limit", limit(20, "Maximum number of results")}},
                                    {"federation", "query"}));
    case ToolId::kFederationListAllRepos:
      return granular(id, "List repositories from local and remote federation members",
                      object_schema({{"federation", prop("string", "Federation name")}},
                                    {"federation"}));
    case ToolId::kIndexDocs:
      return granular(id, "Index documentation files and link them to symbols",
                      object_schema({{"force", prop("boolean", "Re-index unchanged files")}}));
    case ToolId::kGetDocsForSymbol:
      return granular(id, "Find documentation that mentions a symbol",
                      object_schema({{"symbol", prop("string", "Symbol name or stable ID")},
                                     {"limit", limit(10, "Maximum number of documents")}},
                                    {"symbol"}));
    case ToolId::kGetSymbolsInDoc:
      return granular(id, "List symbols referenced by a documentation file",
                      object_schema({{"path", prop("string", "Documentation file path")}},
                                    {"path"}));
    case ToolId::kGetDocsForModule:
      return granular(id, "Find documentation linked to a module",
                      object_schema({{"moduleId", prop("string", "Module ID")}}, {"moduleId"}));
    case ToolId::kCheckDocStaleness:
      return granular(id, "Report documentation that references missing or renamed symbols",
                      object_schema({{"path", prop("string", "Only check this file")},
                                     {"all", prop("boolean", "Check every indexed document")}}));
    case ToolId::kGetDocCoverage:
      return granular(id, "Documentation coverage of exported symbols",
                      object_schema({{"exportedOnly", prop("boolean", "Only count exported symbols")},
                                     {"topN", limit(10, "Number of undocumented symbols to list")}}));
    case ToolId::kDoctor:
      return granular(id, "Diagnose configuration issues and get suggested fixes", object_schema());
    case ToolId::kReindex:
      return granular(id, "Trigger a re-index of the active repository",
                      object_schema({{"scope", prop("string", "Optional path to limit re-indexing")},
                                     {"async", prop("boolean", "Return immediately with a job ID")}}));
    case ToolId::kDaemonStatus:
      return granular(id, "Status of the background daemon", object_schema());
    case ToolId::kListJobs:
      return granular(id, "List background jobs",
                      object_schema({{"status", enum_prop({"queued", "running", "completed",
                                                           "failed", "cancelled"},
                                                          "running", "Status filter")},
                                     {"limit", limit(20, "Maximum number of jobs")}}));
    case ToolId::kGetJobStatus:
      return granular(id, "Status of a background job",
                      object_schema({{"jobId", prop("string", "Job ID")}}, {"jobId"}));
    case ToolId::kCancelJob:
      return granular(id, "Cancel a queued or running job",
                      object_schema({{"jobId", prop("string", "Job ID")}}, {"jobId"}));
    case ToolId::kListSchedules:
      return granular(id, "List scheduled tasks",
                      object_schema({{"enabled", prop("boolean", "Only enabled schedules")}}));
    case ToolId::kRunSchedule:
      return granular(id, "Run a scheduled task now",
                      object_schema({{"scheduleId", prop("string", "Schedule ID")}}, {"scheduleId"}));
    case ToolId::kListWebhooks:
      return granular(id, "List configured webhooks", object_schema());
    case ToolId::kTestWebhook:
      return granular(id, "Send a test delivery to a webhook",
                      object_schema({{"webhookId", prop("string", "Webhook ID")}}, {"webhookId"}));
    case ToolId::kWebhookDeliveries:
      return granular(id, "List recent deliveries for a webhook",
                      object_schema({{"webhookId", prop("string", "Webhook ID")},
                                     {"limit", limit(20, "Maximum number of deliveries")}},
                                    {"webhookId"}));
    case ToolId::kGetWideResultMetrics:
      return granular(id, "Truncation metrics for tools that return wide results", object_schema());
    case ToolId::kListRepos:
      return granular(id, "List registered repositories and which are loaded", object_schema());
    case ToolId::kSwitchRepo:
      return granular(id, "Switch the active repository",
                      object_schema({{"name", prop("string", "Registered repository name")}},
                                    {"name"}));
    case ToolId::kGetActiveRepo:
      return granular(id, "Get the active repository", object_schema());
    case ToolId::kCount:
      break;
  }
  throw std::logic_error("describe: invalid ToolId");
}

std::vector<Tool> build_catalog() {
  std::vector<Tool> tools;
  tools.reserve(kToolCount);
  for (std::size_t i = 0; i < kToolCount; ++i) {
    tools.push_back(describe(static_cast<ToolId>(i)));
  }
  return tools;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Public API
// ────────────────────────────────────────────────────────────────

json tool_to_json(const Tool& tool) {
  return json{
      {"name", tool.name},
      {"description", tool.description},
      {"inputSchema", tool.input_schema},
  };
}

json tools_to_json(const std::vector<Tool>& tools) {
  json out = json::array();
  for (const auto& tool : tools) {
    out.push_back(tool_to_json(tool));
  }
  return out;
}

const std::vector<Tool>& tool_catalog() {
  static const std::vector<Tool> kCatalog = build_catalog();
  return kCatalog;
}

std::string_view tool_name(ToolId id) {
  const auto index = static_cast<std::size_t>(id);
  if (index >= kToolCount) {
    return {};
  }
  return kToolNames[index];
}

std::optional<ToolId> find_tool_id(std::string_view name) {
  for (std::size_t i = 0; i < kToolCount; ++i) {
    if (kToolNames[i] == name) {
      return static_cast<ToolId>(i);
    }
  }
  return std::nullopt;
}

}  // namespace ckmcp::catalog
