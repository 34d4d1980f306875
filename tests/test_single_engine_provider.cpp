#include "ckmcp/core/clock.h"
#include "ckmcp/engine/single_engine_provider.h"

#include <catch2/catch.hpp>

#include <chrono>
#include <memory>
#include <string>

using namespace ckmcp;
using json = nlohmann::json;

namespace {

class StaticEngine final : public engine::IQueryEngine {
 public:
  explicit StaticEngine(std::string path) : path_(std::move(path)) {}

  engine::QueryResult query(std::string_view operation, const json& /*arguments*/) override {
    return engine::QueryResult::ok(json{{"operation", std::string(operation)}});
  }
  json status() override { return json{{"backend", "static"}}; }
  const std::string& repo_path() const override { return path_; }

 private:
  std::string path_;
};

}  // namespace

TEST_CASE("SingleEngineProvider: always leases the one engine", "[provider]") {
  core::ManualClock clock;
  engine::SingleEngineProvider provider(std::make_shared<StaticEngine>("/work/app"), "/work/app",
                                        clock);

  auto lease = provider.acquire();
  REQUIRE(lease.has_value());
  CHECK(lease.value().repo_name() == "app");
  CHECK(lease.value().repo_path() == "/work/app");

  // A path argument is ignored in legacy mode.
  auto other = provider.acquire("/elsewhere");
  REQUIRE(other.has_value());
  CHECK(other.value().repo_path() == "/work/app");
  CHECK(provider.active()->active_ops == 2);
}

TEST_CASE("SingleEngineProvider: switching is unsupported", "[provider]") {
  core::ManualClock clock;
  engine::SingleEngineProvider provider(std::make_shared<StaticEngine>("/work/app"), "/work/app",
                                        clock);
  auto switched = provider.switch_active("web", "/work/web");
  REQUIRE_FALSE(switched.has_value());
  CHECK(switched.error().code == engine::PoolErrorCode::kUnsupported);
  CHECK(switched.error().message ==
        "Multi-repo mode not enabled. Start MCP server with a registry.");
  CHECK_FALSE(provider.multi_repo());
  CHECK(provider.capacity() == 1);
}

TEST_CASE("SingleEngineProvider: introspection reports one active engine", "[provider]") {
  core::ManualClock clock;
  engine::SingleEngineProvider provider(std::make_shared<StaticEngine>("/work/app"), "/work/app",
                                        clock);
  { auto lease = provider.acquire(); }
  clock.advance(std::chrono::milliseconds(40));

  const auto loaded = provider.loaded();
  REQUIRE(loaded.size() == 1);
  CHECK(loaded[0].active);
  CHECK(loaded[0].active_ops == 0);
  CHECK(loaded[0].idle_ms == 40);
  CHECK(provider.is_loaded("/work/app"));
}

TEST_CASE("SingleEngineProvider: acquire after close_all fails", "[provider]") {
  core::ManualClock clock;
  engine::SingleEngineProvider provider(std::make_shared<StaticEngine>("/work/app"), "/work/app",
                                        clock);
  provider.close_all();
  auto lease = provider.acquire();
  REQUIRE_FALSE(lease.has_value());
  CHECK(lease.error().code == engine::PoolErrorCode::kOpenFailed);
  CHECK_FALSE(provider.active().has_value());
  CHECK(provider.loaded().empty());
}
