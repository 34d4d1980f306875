#pragma once

#include "ckmcp/catalog/tool.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ckmcp::catalog {

constexpr std::string_view kPresetCore = "core";
constexpr std::string_view kPresetReview = "review";
constexpr std::string_view kPresetRefactor = "refactor";
constexpr std::string_view kPresetFederation = "federation";
constexpr std::string_view kPresetDocs = "docs";
constexpr std::string_view kPresetOps = "ops";
constexpr std::string_view kPresetFull = "full";

// New sessions start here.
constexpr std::string_view kDefaultPreset = kPresetCore;

// A preset whose tool list is exactly {"*"} exposes the whole catalog.
constexpr std::string_view kWildcard = "*";

// All preset names, default first.
[[nodiscard]] const std::vector<std::string>& valid_presets();
[[nodiscard]] bool is_valid_preset(std::string_view preset);

// Tool names for a preset. Unknown names fall back to the default preset.
[[nodiscard]] const std::vector<std::string>& preset_tools(std::string_view preset);

// canonical_tool_order is the priority sequence that leads every filtered list.
[[nodiscard]] const std::vector<std::string>& canonical_tool_order();

// filter_and_order_tools keeps the tools named by preset, then orders them:
// canonical-priority tools first in their fixed sequence, the rest ascending by name.
[[nodiscard]] std::vector<Tool> filter_and_order_tools(const std::vector<Tool>& all_tools,
                                                       std::string_view preset);

// ─── Preset info ───

struct PresetInfo {
  std::string name;          // NOLINT(readability-identifier-naming)
  std::size_t tool_count{};  // NOLINT(readability-identifier-naming)
  std::size_t token_count{};  // NOLINT(readability-identifier-naming)
  std::string description;   // NOLINT(readability-identifier-naming)
  bool is_default{false};    // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::string preset_description(std::string_view preset);

// Rough token cost of advertising tools: serialized tools/list bytes / 4.
[[nodiscard]] std::size_t estimate_tokens(const std::vector<Tool>& tools);

// "~12k tokens" for >= 1000 (rounded to nearest thousand), otherwise "~850 tokens".
[[nodiscard]] std::string format_tokens(std::size_t tokens);

[[nodiscard]] std::vector<PresetInfo> all_preset_info(const std::vector<Tool>& all_tools);

}  // namespace ckmcp::catalog
