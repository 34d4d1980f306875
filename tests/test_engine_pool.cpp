#include "ckmcp/core/clock.h"
#include "ckmcp/engine/engine_pool.h"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace ckmcp;
using json = nlohmann::json;

namespace {

class FakeEngine final : public engine::IQueryEngine {
 public:
  explicit FakeEngine(std::string path) : path_(std::move(path)) {}

  engine::QueryResult query(std::string_view operation, const json& /*arguments*/) override {
    return engine::QueryResult::ok(json{{"operation", std::string(operation)}, {"repo", path_}});
  }
  json status() override { return json{{"backend", "fake"}, {"repoPath", path_}}; }
  const std::string& repo_path() const override { return path_; }

 private:
  std::string path_;
};

// Counts factory calls per path; "/broken" fails to open.
struct FactoryLog {
  std::map<std::string, int> opens;
};

engine::EngineFactory make_factory(FactoryLog& log) {
  return [&log](const std::string& path) {
    using R = core::Result<std::shared_ptr<engine::IQueryEngine>, std::string>;
    if (path == "/broken") {
      return R::err("Repository not initialized: /broken (missing .ckmcp/)");
    }
    ++log.opens[path];
    return R::ok(std::make_shared<FakeEngine>(path));
  };
}

}  // namespace

// ── Switching & acquiring ───────────────────────────────────────────────────

TEST_CASE("EnginePool: acquire before any switch reports no active repo", "[pool]") {
  FactoryLog log;
  core::ManualClock clock;
  engine::EnginePool pool(make_factory(log), clock, 3);

  auto lease = pool.acquire();
  REQUIRE_FALSE(lease.has_value());
  CHECK(lease.error().code == engine::PoolErrorCode::kNoActiveRepo);
  CHECK_FALSE(pool.active().has_value());
}

TEST_CASE("EnginePool: switch_active opens once and marks active", "[pool]") {
  FactoryLog log;
  core::ManualClock clock;
  engine::EnginePool pool(make_factory(log), clock, 3);

  auto info = pool.switch_active("api", "/src/api");
  REQUIRE(info.has_value());
  CHECK(info.value().repo_name == "api");
  CHECK(info.value().active);
  CHECK(info.value().active_ops == 0);

  {
    auto lease = pool.acquire();
    REQUIRE(lease.has_value());
    CHECK(lease.value().repo_name() == "api");
    CHECK(lease.value()->repo_path() == "/src/api");
  }

  // Switching back to a loaded repo reuses its engine.
  REQUIRE(pool.switch_active("web", "/src/web").has_value());
  REQUIRE(pool.switch_active("api", "/src/api").has_value());
  CHECK(log.opens["/src/api"] == 1);
  CHECK(pool.size() == 2);
  CHECK(pool.active()->repo_path == "/src/api");
}

TEST_CASE("EnginePool: factory failure is reported and nothing is cached", "[pool]") {
  FactoryLog log;
  core::ManualClock clock;
  engine::EnginePool pool(make_factory(log), clock, 3);

  auto info = pool.switch_active("broken", "/broken");
  REQUIRE_FALSE(info.has_value());
  CHECK(info.error().code == engine::PoolErrorCode::kOpenFailed);
  CHECK(pool.size() == 0);
  CHECK_FALSE(pool.active().has_value());
}

// ── Lease accounting ────────────────────────────────────────────────────────

TEST_CASE("EngineLease: active_ops follows lease lifetime", "[pool]") {
  FactoryLog log;
  core::ManualClock clock;
  engine::EnginePool pool(make_factory(log), clock, 3);
  REQUIRE(pool.switch_active("api", "/src/api").has_value());

  {
    auto first = pool.acquire();
    auto second = pool.acquire();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(pool.active()->active_ops == 2);

    // Moving a lease transfers, not duplicates, the hold.
    engine::EngineLease moved = std::move(first.value());
    CHECK(pool.active()->active_ops == 2);

    second.value().release();
    CHECK(pool.active()->active_ops == 1);
    // Double release is a no-op.
    second.value().release();
    CHECK(pool.active()->active_ops == 1);
  }
  CHECK(pool.active()->active_ops == 0);
}

// ── Eviction ────────────────────────────────────────────────────────────────

TEST_CASE("EnginePool: evicts the least recently used idle engine at capacity", "[pool]") {
  FactoryLog log;
  core::ManualClock clock;
  engine::EnginePool pool(make_factory(log), clock, 3);

  std::vector<std::string> evicted;
  pool.set_eviction_listener(
      [&evicted](const engine::EngineInfo& info) { evicted.push_back(info.repo_path); });

  REQUIRE(pool.switch_active("a", "/a").has_value());
  clock.advance(std::chrono::milliseconds(10));
  REQUIRE(pool.switch_active("b", "/b").has_value());
  clock.advance(std::chrono::milliseconds(10));
  REQUIRE(pool.switch_active("c", "/c").has_value());
  clock.advance(std::chrono::milliseconds(10));

  // Touch /a so /b becomes the oldest idle entry.
  { auto lease = pool.acquire("/a"); }
  clock.advance(std::chrono::milliseconds(10));

  REQUIRE(pool.switch_active("d", "/d").has_value());
  CHECK(pool.size() == 3);
  CHECK(evicted == std::vector<std::string>{"/b"});
  CHECK(pool.is_loaded("/a"));
  CHECK_FALSE(pool.is_loaded("/b"));
  CHECK(pool.is_loaded("/c"));
  CHECK(pool.is_loaded("/d"));
}

TEST_CASE("EnginePool: the active engine is never evicted", "[pool]") {
  FactoryLog log;
  core::ManualClock clock;
  engine::EnginePool pool(make_factory(log), clock, 2);

  REQUIRE(pool.switch_active("a", "/a").has_value());
  clock.advance(std::chrono::milliseconds(5));
  { auto lease = pool.acquire("/b"); }
  clock.advance(std::chrono::milliseconds(5));

  // /a is older but active, so /b goes.
  auto lease = pool.acquire("/c");
  REQUIRE(lease.has_value());
  CHECK(pool.is_loaded("/a"));
  CHECK_FALSE(pool.is_loaded("/b"));
  CHECK(pool.active()->repo_path == "/a");
}

TEST_CASE("EnginePool: in-use engines are never evicted", "[pool]") {
  FactoryLog log;
  core::ManualClock clock;
  engine::EnginePool pool(make_factory(log), clock, 2);

  REQUIRE(pool.switch_active("a", "/a").has_value());
  auto busy = pool.acquire("/b");
  REQUIRE(busy.has_value());

  // /a is active and /b is leased: nothing can make room.
  auto blocked = pool.acquire("/c");
  REQUIRE_FALSE(blocked.has_value());
  CHECK(blocked.error().code == engine::PoolErrorCode::kExhausted);
  CHECK(blocked.error().retryable());
  CHECK(log.opens.count("/c") == 0);

  // Releasing /b frees a slot.
  busy.value().release();
  auto retried = pool.acquire("/c");
  REQUIRE(retried.has_value());
  CHECK_FALSE(pool.is_loaded("/b"));
}

TEST_CASE("EnginePool: size never exceeds capacity", "[pool]") {
  FactoryLog log;
  core::ManualClock clock;
  engine::EnginePool pool(make_factory(log), clock, 2);
  for (int i = 0; i < 10; ++i) {
    REQUIRE(pool.switch_active("r" + std::to_string(i), "/r" + std::to_string(i)).has_value());
    clock.advance(std::chrono::milliseconds(1));
    CHECK(pool.size() <= 2);
  }
  CHECK(pool.active()->repo_path == "/r9");
}

// ── Introspection & shutdown ────────────────────────────────────────────────

TEST_CASE("EnginePool: loaded reports idle time from the clock", "[pool]") {
  FactoryLog log;
  core::ManualClock clock;
  engine::EnginePool pool(make_factory(log), clock, 3);
  REQUIRE(pool.switch_active("a", "/a").has_value());
  clock.advance(std::chrono::milliseconds(250));

  const auto loaded = pool.loaded();
  REQUIRE(loaded.size() == 1);
  CHECK(loaded[0].idle_ms == 250);
  CHECK(loaded[0].loaded_at == "2026-01-01T00:00:00Z");
  CHECK(pool.multi_repo());
  CHECK(pool.capacity() == 3);
}

TEST_CASE("EnginePool: close_all waits for outstanding leases", "[pool]") {
  FactoryLog log;
  core::ManualClock clock;
  engine::EnginePool pool(make_factory(log), clock, 3);
  REQUIRE(pool.switch_active("a", "/a").has_value());

  auto lease = pool.acquire();
  REQUIRE(lease.has_value());

  std::atomic<bool> closed{false};
  std::thread closer([&pool, &closed]() {
    pool.close_all();
    closed = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  CHECK_FALSE(closed.load());
  // The lease still works while close_all waits.
  CHECK(lease.value()->query("getStatus", json::object()).has_value());

  lease.value().release();
  closer.join();
  CHECK(closed.load());
  CHECK(pool.size() == 0);
  CHECK_FALSE(pool.active().has_value());
}

TEST_CASE("EnginePool: concurrent acquire keeps counts consistent", "[pool]") {
  FactoryLog log;
  core::SystemClock clock;
  engine::EnginePool pool(make_factory(log), clock, 2);
  REQUIRE(pool.switch_active("a", "/a").has_value());

  std::vector<std::thread> workers;
  std::atomic<int> failures{0};
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&pool, &failures]() {
      for (int i = 0; i < 100; ++i) {
        auto lease = pool.acquire();
        if (!lease.has_value() || !lease.value()->query("searchSymbols", json::object()).has_value()) {
          ++failures;
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  CHECK(failures.load() == 0);
  CHECK(pool.active()->active_ops == 0);
  CHECK(log.opens["/a"] == 1);
}
