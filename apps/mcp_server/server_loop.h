#pragma once

#include "ckmcp/protocol/jsonrpc.h"

#include "method_handlers.h"
#include "server_context.h"
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>

namespace ckmcp::mcp {

// Dispatcher classifies one frame and routes it: requests to the method registry (one reply
// each), notifications to the notification registry (never a reply), responses to the
// pending-request registry (never a reply).
class Dispatcher {
 public:
  explicit Dispatcher(ServerContext& ctx);

  // Returns the reply frame, or nullopt when the frame gets no reply.
  [[nodiscard]] std::optional<std::string> handle_line(const std::string& line);

 private:
  std::string handle_request(const protocol::JsonRpcMessage& req);
  void handle_notification(const protocol::JsonRpcMessage& msg);
  void handle_response(const protocol::JsonRpcMessage& msg);

  ServerContext& ctx_;
  std::unordered_map<std::string, MethodHandler> methods_;
  std::unordered_map<std::string, NotificationHandler> notifications_;
};

// Reads newline-delimited frames from in until end of stream, writing replies through
// ctx.writer. On exit, cancels pending requests, joins background work and closes engines.
void run_server_loop(ServerContext& ctx, std::istream& in);

}  // namespace ckmcp::mcp
