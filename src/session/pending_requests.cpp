#include "ckmcp/session/pending_requests.h"

#include <utility>

namespace ckmcp::session {

std::int64_t PendingRequests::next_id() {
  return ++last_id_;
}

std::future<protocol::JsonRpcMessage> PendingRequests::register_request(std::int64_t id) {
  std::promise<protocol::JsonRpcMessage> promise;
  auto future = promise.get_future();
  pending_.insert_or_assign(id, std::move(promise));
  return future;
}

bool PendingRequests::resolve(std::int64_t id, protocol::JsonRpcMessage message) {
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    return false;
  }
  auto promise = std::move(it->second);
  pending_.erase(it);
  promise.set_value(std::move(message));
  return true;
}

bool PendingRequests::cancel(std::int64_t id) {
  // Destroying the promise unsatisfied stores broken_promise in the shared state.
  return pending_.erase(id) > 0;
}

std::size_t PendingRequests::cancel_all() {
  const std::size_t count = pending_.size();
  pending_.clear();
  return count;
}

}  // namespace ckmcp::session
