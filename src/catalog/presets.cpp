#include "ckmcp/catalog/presets.h"

#include <algorithm>
#include <initializer_list>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace ckmcp::catalog {

namespace {

const std::vector<std::string> kCoreTools = {
    // Compound tools lead
    "explore",
    "understand",
    "prepareChange",
    "batchGet",
    "batchSearch",
    // Granular fallback
    "searchSymbols",
    "getSymbol",
    "explainSymbol",
    "explainFile",
    "findReferences",
    "getCallGraph",
    "traceUsage",
    "getArchitecture",
    "getModuleOverview",
    "listKeyConcepts",
    "analyzeImpact",
    "getHotspots",
    "getStatus",
    "expandToolset",
};

std::vector<std::string> core_plus(std::initializer_list<const char*> extra) {
  std::vector<std::string> tools = kCoreTools;
  tools.insert(tools.end(), extra.begin(), extra.end());
  return tools;
}

// Every non-core preset is built from the core list, so expanding never loses a core tool.
const std::map<std::string, std::vector<std::string>, std::less<>>& preset_table() {
  static const std::map<std::string, std::vector<std::string>, std::less<>> kTable = {
      {std::string(kPresetCore), kCoreTools},
      {std::string(kPresetReview),
       core_plus({"summarizeDiff", "summarizePr", "getOwnership", "getOwnershipDrift",
                  "recentlyRelevant", "scanSecrets"})},
      {std::string(kPresetRefactor),
       core_plus({"justifySymbol", "analyzeCoupling", "findDeadCodeCandidates", "findDeadCode",
                  "getAffectedTests", "compareAPI", "auditRisk", "explainOrigin",
                  "scanSecrets"})},
      {std::string(kPresetFederation),
       core_plus({"listFederations", "federationStatus", "federationRepos",
                  "federationSearchModules", "federationSearchOwnership",
                  "federationGetHotspots", "federationSync", "federationAddRemote",
                  "federationRemoveRemote", "federationListRemote", "federationSyncRemote",
                  "federationStatusRemote", "federationSearchSymbolsHybrid",
                  "federationListAllRepos"})},
      {std::string(kPresetDocs),
       core_plus({"indexDocs", "getDocsForSymbol", "getSymbolsInDoc", "getDocsForModule",
                  "checkDocStaleness", "getDocCoverage"})},
      {std::string(kPresetOps),
       core_plus({"doctor", "reindex", "daemonStatus", "listJobs", "getJobStatus", "cancelJob",
                  "listSchedules", "runSchedule", "listWebhooks", "testWebhook",
                  "webhookDeliveries", "getWideResultMetrics"})},
      {std::string(kPresetFull), {std::string(kWildcard)}},
  };
  return kTable;
}

std::vector<Tool> order_core_first(const std::vector<Tool>& tools) {
  std::unordered_map<std::string, const Tool*> by_name;
  by_name.reserve(tools.size());
  for (const auto& tool : tools) {
    by_name.emplace(tool.name, &tool);
  }

  std::vector<Tool> ordered;
  ordered.reserve(tools.size());
  for (const auto& name : kCoreTools) {
    auto it = by_name.find(name);
    if (it != by_name.end()) {
      ordered.push_back(*it->second);
      by_name.erase(it);
    }
  }

  std::vector<const Tool*> rest;
  rest.reserve(by_name.size());
  for (const auto& [name, tool] : by_name) {
    rest.push_back(tool);
  }
  std::sort(rest.begin(), rest.end(),
            [](const Tool* a, const Tool* b) { return a->name < b->name; });
  for (const Tool* tool : rest) {
    ordered.push_back(*tool);
  }
  return ordered;
}

}  // namespace

const std::vector<std::string>& valid_presets() {
  static const std::vector<std::string> kNames = {
      std::string(kPresetCore),       std::string(kPresetReview), std::string(kPresetRefactor),
      std::string(kPresetFederation), std::string(kPresetDocs),   std::string(kPresetOps),
      std::string(kPresetFull),
  };
  return kNames;
}

bool is_valid_preset(std::string_view preset) {
  return preset_table().find(preset) != preset_table().end();
}

const std::vector<std::string>& preset_tools(std::string_view preset) {
  const auto& table = preset_table();
  auto it = table.find(preset);
  if (it == table.end()) {
    return table.find(kDefaultPreset)->second;
  }
  return it->second;
}

const std::vector<std::string>& canonical_tool_order() {
  return kCoreTools;
}

std::vector<Tool> filter_and_order_tools(const std::vector<Tool>& all_tools,
                                         std::string_view preset) {
  const auto& names = preset_tools(preset);
  if (names.size() == 1 && names.front() == kWildcard) {
    return order_core_first(all_tools);
  }

  const std::unordered_set<std::string> wanted(names.begin(), names.end());
  std::vector<Tool> filtered;
  filtered.reserve(names.size());
  for (const auto& tool : all_tools) {
    if (wanted.count(tool.name) > 0) {
      filtered.push_back(tool);
    }
  }
  return order_core_first(filtered);
}

// ────────────────────────────────────────────────────────────────
// Preset info
// ────────────────────────────────────────────────────────────────

std::string preset_description(std::string_view preset) {
  static const std::map<std::string, std::string, std::less<>> kDescriptions = {
      {std::string(kPresetCore), "Quick navigation, search, impact analysis"},
      {std::string(kPresetReview), "Code review with ownership and PR summaries"},
      {std::string(kPresetRefactor), "Refactoring analysis with coupling and dead code"},
      {std::string(kPresetFederation), "Multi-repo queries and cross-repo visibility"},
      {std::string(kPresetDocs), "Documentation-symbol linking and coverage"},
      {std::string(kPresetOps), "Diagnostics, daemon, webhooks, jobs"},
      {std::string(kPresetFull), "Complete feature set (all tools)"},
  };
  auto it = kDescriptions.find(preset);
  return it == kDescriptions.end() ? std::string{} : it->second;
}

std::size_t estimate_tokens(const std::vector<Tool>& tools) {
  return tools_to_json(tools).dump().size() / 4;
}

std::string format_tokens(std::size_t tokens) {
  if (tokens >= 1000) {
    return "~" + std::to_string((tokens + 500) / 1000) + "k tokens";
  }
  return "~" + std::to_string(tokens) + " tokens";
}

std::vector<PresetInfo> all_preset_info(const std::vector<Tool>& all_tools) {
  std::vector<PresetInfo> infos;
  infos.reserve(valid_presets().size());
  for (const auto& name : valid_presets()) {
    const auto filtered = filter_and_order_tools(all_tools, name);
    infos.push_back(PresetInfo{
        .name = name,
        .tool_count = filtered.size(),
        .token_count = estimate_tokens(filtered),
        .description = preset_description(name),
        .is_default = name == kDefaultPreset,
    });
  }
  return infos;
}

}  // namespace ckmcp::catalog
