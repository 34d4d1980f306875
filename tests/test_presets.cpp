#include "ckmcp/catalog/catalog.h"
#include "ckmcp/catalog/presets.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace ckmcp;

static std::vector<std::string> names_of(const std::vector<catalog::Tool>& tools) {
  std::vector<std::string> names;
  names.reserve(tools.size());
  for (const auto& tool : tools) {
    names.push_back(tool.name);
  }
  return names;
}

TEST_CASE("valid_presets: seven presets with core as default", "[presets]") {
  CHECK(catalog::valid_presets().size() == 7);
  CHECK(catalog::kDefaultPreset == "core");
  for (const auto& name : catalog::valid_presets()) {
    CHECK(catalog::is_valid_preset(name));
  }
  CHECK_FALSE(catalog::is_valid_preset("everything"));
  CHECK_FALSE(catalog::is_valid_preset(""));
}

TEST_CASE("filter_and_order_tools: core preset lists core tools in canonical order",
          "[presets]") {
  const auto core = catalog::filter_and_order_tools(catalog::tool_catalog(), "core");
  CHECK(names_of(core) == catalog::canonical_tool_order());
  CHECK(core.size() == 19);
  CHECK(core.front().name == "explore");
}

TEST_CASE("filter_and_order_tools: every preset is a superset of core", "[presets]") {
  const auto core = names_of(catalog::filter_and_order_tools(catalog::tool_catalog(), "core"));
  for (const auto& preset : catalog::valid_presets()) {
    INFO(preset);
    const auto tools = names_of(catalog::filter_and_order_tools(catalog::tool_catalog(), preset));
    REQUIRE(tools.size() >= core.size());
    // Core tools always lead, in the same order.
    CHECK(std::equal(core.begin(), core.end(), tools.begin()));
  }
}

TEST_CASE("filter_and_order_tools: full preset exposes the whole catalog", "[presets]") {
  const auto full = catalog::filter_and_order_tools(catalog::tool_catalog(), "full");
  CHECK(full.size() == catalog::tool_catalog().size());

  const auto names = names_of(full);
  const std::set<std::string> unique(names.begin(), names.end());
  CHECK(unique.size() == names.size());

  // Non-core tools follow alphabetically.
  const auto core_count = catalog::canonical_tool_order().size();
  CHECK(std::is_sorted(names.begin() + static_cast<std::ptrdiff_t>(core_count), names.end()));
}

TEST_CASE("filter_and_order_tools: preset tools missing from the catalog are skipped",
          "[presets]") {
  const std::vector<catalog::Tool> partial = {
      catalog::Tool{.name = "getStatus", .description = "s", .input_schema = {}, .kind = {}},
      catalog::Tool{.name = "explore", .description = "e", .input_schema = {}, .kind = {}},
      catalog::Tool{.name = "unlisted", .description = "u", .input_schema = {}, .kind = {}},
  };
  const auto core = catalog::filter_and_order_tools(partial, "core");
  CHECK(names_of(core) == std::vector<std::string>{"explore", "getStatus"});

  const auto full = catalog::filter_and_order_tools(partial, "full");
  CHECK(names_of(full) == std::vector<std::string>{"explore", "getStatus", "unlisted"});
}

TEST_CASE("filter_and_order_tools: review adds its tools after core", "[presets]") {
  const auto review = names_of(catalog::filter_and_order_tools(catalog::tool_catalog(), "review"));
  CHECK(std::find(review.begin(), review.end(), "summarizePr") != review.end());
  CHECK(std::find(review.begin(), review.end(), "federationSync") == review.end());
}

TEST_CASE("all_preset_info: counts match filtered lists", "[presets]") {
  const auto infos = catalog::all_preset_info(catalog::tool_catalog());
  REQUIRE(infos.size() == catalog::valid_presets().size());
  for (const auto& info : infos) {
    INFO(info.name);
    CHECK(info.tool_count ==
          catalog::filter_and_order_tools(catalog::tool_catalog(), info.name).size());
    CHECK(info.token_count > 0);
    CHECK_FALSE(info.description.empty());
    CHECK(info.is_default == (info.name == "core"));
  }
}

TEST_CASE("format_tokens: rounds to thousands", "[presets]") {
  CHECK(catalog::format_tokens(800) == "~800 tokens");
  CHECK(catalog::format_tokens(1000) == "~1k tokens");
  CHECK(catalog::format_tokens(7499) == "~7k tokens");
  CHECK(catalog::format_tokens(7500) == "~8k tokens");
}
