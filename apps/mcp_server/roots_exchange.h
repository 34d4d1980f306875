#pragma once

#include "ckmcp/protocol/jsonrpc.h"
#include "ckmcp/session/session.h"

#include "message_writer.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace ckmcp::mcp {

// RootsExchange sends roots/list to the client and waits for the reply off the main loop.
//
// Each request gets a worker thread that races the reply against the timeout. The pending
// entry is removed on every exit path: delivery (resolved by the dispatcher), timeout
// (cancelled here), send failure (cancelled here) and shutdown (cancel_all). Finished
// workers are joined on the next request, so at most the in-flight ones are retained.
class RootsExchange {
 public:
  RootsExchange(session::Session& session, MessageWriter& writer,
                std::chrono::milliseconds timeout);
  ~RootsExchange();

  RootsExchange(const RootsExchange&) = delete;
  RootsExchange& operator=(const RootsExchange&) = delete;
  RootsExchange(RootsExchange&&) = delete;
  RootsExchange& operator=(RootsExchange&&) = delete;

  // Sends roots/list when the client supports roots. Returns the request id, or 0 when
  // nothing was sent.
  std::int64_t request_roots();

  // Blocks until every worker has finished (delivered or timed out).
  void wait_for_workers();

  // Joins finished workers and returns how many are still running.
  std::size_t active_workers();

  // Cancels outstanding requests and joins the workers. Idempotent.
  void shutdown();

 private:
  void await_reply(std::int64_t id, std::future<protocol::JsonRpcMessage> reply);
  void apply_reply(std::int64_t id, const protocol::JsonRpcMessage& reply);
  void reap_finished_locked();

  struct Worker {
    std::thread thread;                      // NOLINT(readability-identifier-naming)
    std::shared_ptr<std::atomic<bool>> done;  // NOLINT(readability-identifier-naming)
  };

  session::Session& session_;
  MessageWriter& writer_;
  std::chrono::milliseconds timeout_;

  std::mutex workers_mutex_;
  std::vector<Worker> workers_;
  bool stopped_{false};
};

}  // namespace ckmcp::mcp
