#include "ckmcp/session/pending_requests.h"

#include <catch2/catch.hpp>

#include <chrono>
#include <future>

using namespace ckmcp;

static protocol::JsonRpcMessage reply_with(std::int64_t id) {
  protocol::JsonRpcMessage msg;
  msg.id = id;
  msg.result = nlohmann::json{{"roots", nlohmann::json::array()}};
  return msg;
}

TEST_CASE("PendingRequests: ids are monotonic from 1", "[pending]") {
  session::PendingRequests pending;
  CHECK(pending.next_id() == 1);
  CHECK(pending.next_id() == 2);
  CHECK(pending.next_id() == 3);
}

TEST_CASE("PendingRequests: resolve delivers exactly once", "[pending]") {
  session::PendingRequests pending;
  const auto id = pending.next_id();
  auto future = pending.register_request(id);
  CHECK(pending.size() == 1);

  CHECK(pending.resolve(id, reply_with(id)));
  CHECK(pending.size() == 0);
  REQUIRE(future.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
  const auto msg = future.get();
  CHECK(msg.numeric_id() == id);

  // A duplicate reply finds nothing.
  CHECK_FALSE(pending.resolve(id, reply_with(id)));
}

TEST_CASE("PendingRequests: unknown id is not resolved", "[pending]") {
  session::PendingRequests pending;
  CHECK_FALSE(pending.resolve(99, reply_with(99)));
}

TEST_CASE("PendingRequests: cancel breaks the waiter", "[pending]") {
  session::PendingRequests pending;
  const auto id = pending.next_id();
  auto future = pending.register_request(id);

  CHECK(pending.cancel(id));
  CHECK(pending.size() == 0);
  CHECK_THROWS_AS(future.get(), std::future_error);

  // A late reply after cancellation is dropped.
  CHECK_FALSE(pending.resolve(id, reply_with(id)));
  CHECK_FALSE(pending.cancel(id));
}

TEST_CASE("PendingRequests: cancel_all clears every entry", "[pending]") {
  session::PendingRequests pending;
  auto a = pending.register_request(pending.next_id());
  auto b = pending.register_request(pending.next_id());
  CHECK(pending.cancel_all() == 2);
  CHECK(pending.size() == 0);
  CHECK_THROWS_AS(a.get(), std::future_error);
  CHECK_THROWS_AS(b.get(), std::future_error);
}

TEST_CASE("PendingRequests: ids are not reused after resolution", "[pending]") {
  session::PendingRequests pending;
  const auto first = pending.next_id();
  auto future = pending.register_request(first);
  CHECK(pending.resolve(first, reply_with(first)));
  CHECK(pending.next_id() > first);
}
