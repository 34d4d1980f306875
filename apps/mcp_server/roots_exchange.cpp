#include "roots_exchange.h"

#include "ckmcp/session/roots.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace ckmcp::mcp {

RootsExchange::RootsExchange(session::Session& session, MessageWriter& writer,
                             std::chrono::milliseconds timeout)
    : session_(session), writer_(writer), timeout_(timeout) {}

RootsExchange::~RootsExchange() {
  shutdown();
}

std::int64_t RootsExchange::request_roots() {
  if (!session_.roots_supported()) {
    return 0;
  }

  std::lock_guard<std::mutex> lock(workers_mutex_);
  if (stopped_) {
    return 0;
  }
  reap_finished_locked();

  // Register before sending so a fast reply always finds its entry.
  const std::int64_t id = session_.next_request_id();
  auto reply = session_.register_pending(id);

  if (!writer_.write(protocol::make_request(id, "roots/list"))) {
    session_.cancel_pending(id);
    std::cerr << "Failed to send roots/list request id=" << id << "\n";
    return 0;
  }

  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread thread([this, id, done, reply = std::move(reply)]() mutable {
    await_reply(id, std::move(reply));
    done->store(true);
  });
  workers_.push_back(Worker{.thread = std::move(thread), .done = std::move(done)});
  return id;
}

void RootsExchange::reap_finished_locked() {
  auto finished = std::partition(workers_.begin(), workers_.end(),
                                 [](const Worker& worker) { return !worker.done->load(); });
  for (auto it = finished; it != workers_.end(); ++it) {
    if (it->thread.joinable()) {
      it->thread.join();
    }
  }
  workers_.erase(finished, workers_.end());
}

std::size_t RootsExchange::active_workers() {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  reap_finished_locked();
  return workers_.size();
}

void RootsExchange::await_reply(std::int64_t id, std::future<protocol::JsonRpcMessage> reply) {
  if (reply.wait_for(timeout_) == std::future_status::timeout) {
    // A reply that lands between the timeout and the cancel is still honoured.
    if (session_.cancel_pending(id)) {
      std::cerr << "roots/list request id=" << id << " timed out after " << timeout_.count()
                << "ms\n";
      return;
    }
  }

  protocol::JsonRpcMessage message;
  try {
    message = reply.get();
  } catch (const std::future_error&) {
    // Cancelled at shutdown.
    return;
  }
  apply_reply(id, message);
}

void RootsExchange::apply_reply(std::int64_t id, const protocol::JsonRpcMessage& reply) {
  if (reply.error.has_value()) {
    if (reply.error->code == protocol::kMethodNotFound) {
      session_.disable_roots();
      std::cerr << "Client does not support roots/list; roots disabled for this session\n";
      return;
    }
    std::cerr << "roots/list request id=" << id << " failed: " << reply.error->code << " "
              << reply.error->message << "\n";
    return;
  }

  auto roots = session::parse_roots_result(reply.result.value_or(nlohmann::json()));
  if (!roots.has_value()) {
    std::cerr << "roots/list reply id=" << id << " has no roots array; keeping previous roots\n";
    return;
  }
  const auto count = roots->size();
  session_.set_roots(std::move(roots.value()));
  std::cerr << "Updated roots from client: " << count << "\n";
}

void RootsExchange::wait_for_workers() {
  std::vector<Worker> joining;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    joining.swap(workers_);
  }
  for (auto& worker : joining) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

void RootsExchange::shutdown() {
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    stopped_ = true;
  }
  const auto cancelled = session_.cancel_all_pending();
  if (cancelled > 0) {
    std::cerr << "Cancelled " << cancelled << " pending request(s) at shutdown\n";
  }
  wait_for_workers();
}

}  // namespace ckmcp::mcp
