#pragma once

#include "ckmcp/protocol/jsonrpc.h"

#include <cstddef>
#include <cstdint>
#include <future>
#include <unordered_map>

namespace ckmcp::session {

// PendingRequests correlates replies to server-initiated requests by numeric id.
//
// Each entry is consumed exactly once: resolve() delivers the reply through the future
// returned by register_request(); cancel() drops the entry and breaks the promise so a
// waiter sees std::future_error instead of hanging.
//
// Not synchronized. The owning Session guards every call with its lock.
class PendingRequests {
 public:
  PendingRequests() = default;

  PendingRequests(const PendingRequests&) = delete;
  PendingRequests& operator=(const PendingRequests&) = delete;
  PendingRequests(PendingRequests&&) = default;
  PendingRequests& operator=(PendingRequests&&) = default;

  // Monotonic, starting at 1. Never reused within the registry's lifetime.
  [[nodiscard]] std::int64_t next_id();

  // Re-registering an id still pending replaces (and breaks) the older entry.
  [[nodiscard]] std::future<protocol::JsonRpcMessage> register_request(std::int64_t id);

  // true if id was pending; the entry is removed and the message delivered.
  bool resolve(std::int64_t id, protocol::JsonRpcMessage message);

  // true if id was pending; the entry is removed without delivery.
  bool cancel(std::int64_t id);

  // Cancels every pending entry and returns how many there were.
  std::size_t cancel_all();

  [[nodiscard]] std::size_t size() const { return pending_.size(); }

 private:
  std::int64_t last_id_{0};
  std::unordered_map<std::int64_t, std::promise<protocol::JsonRpcMessage>> pending_;
};

}  // namespace ckmcp::session
