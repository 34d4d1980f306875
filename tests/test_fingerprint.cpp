#include "ckmcp/catalog/catalog.h"
#include "ckmcp/catalog/fingerprint.h"
#include "ckmcp/catalog/presets.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <vector>

using namespace ckmcp;

static std::vector<catalog::Tool> sample_tools() {
  return {
      catalog::Tool{.name = "alpha",
                    .description = "first",
                    .input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}},
                    .kind = catalog::ToolKind::kGranular},
      catalog::Tool{.name = "beta",
                    .description = "second",
                    .input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}},
                    .kind = catalog::ToolKind::kGranular},
  };
}

TEST_CASE("toolset_fingerprint: 16 lowercase hex characters", "[fingerprint]") {
  const auto fp = catalog::toolset_fingerprint(sample_tools());
  REQUIRE(fp.size() == catalog::kFingerprintLength);
  CHECK(std::all_of(fp.begin(), fp.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  }));
}

TEST_CASE("toolset_fingerprint: deterministic and order-independent", "[fingerprint]") {
  auto tools = sample_tools();
  const auto first = catalog::toolset_fingerprint(tools);
  CHECK(catalog::toolset_fingerprint(tools) == first);

  std::reverse(tools.begin(), tools.end());
  CHECK(catalog::toolset_fingerprint(tools) == first);
}

TEST_CASE("toolset_fingerprint: sensitive to name, description and schema", "[fingerprint]") {
  const auto base = catalog::toolset_fingerprint(sample_tools());

  SECTION("description") {
    auto tools = sample_tools();
    tools[0].description = "first, reworded";
    CHECK(catalog::toolset_fingerprint(tools) != base);
  }
  SECTION("schema") {
    auto tools = sample_tools();
    tools[1].input_schema["required"] = nlohmann::json::array({"x"});
    CHECK(catalog::toolset_fingerprint(tools) != base);
  }
  SECTION("name") {
    auto tools = sample_tools();
    tools[0].name = "alpha2";
    CHECK(catalog::toolset_fingerprint(tools) != base);
  }
  SECTION("membership") {
    auto tools = sample_tools();
    tools.pop_back();
    CHECK(catalog::toolset_fingerprint(tools) != base);
  }
}

TEST_CASE("toolset_fingerprint: field boundaries are unambiguous", "[fingerprint]") {
  auto a = sample_tools();
  auto b = sample_tools();
  a[0].name = "ab";
  a[0].description = "c";
  b[0].name = "a";
  b[0].description = "bc";
  CHECK(catalog::toolset_fingerprint(a) != catalog::toolset_fingerprint(b));
}

TEST_CASE("toolset_fingerprint: presets with different tools differ", "[fingerprint]") {
  const auto core =
      catalog::toolset_fingerprint(catalog::filter_and_order_tools(catalog::tool_catalog(), "core"));
  const auto full =
      catalog::toolset_fingerprint(catalog::filter_and_order_tools(catalog::tool_catalog(), "full"));
  CHECK(core != full);
}
