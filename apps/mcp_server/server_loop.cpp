#include "server_loop.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <exception>
#include <iostream>
#include <string>

namespace ckmcp::mcp {

using json = nlohmann::json;

namespace {

bool is_blank(const std::string& line) {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

// Only a string or number id can address a reply; anything else gets null.
std::optional<json> reply_id(const std::optional<json>& id) {
  if (id.has_value() && (id->is_string() || id->is_number())) {
    return id;
  }
  return std::nullopt;
}

// Reads one newline-terminated frame, storing at most limit + 1 bytes and discarding the
// rest of the line. A longer frame therefore still fails the size check. Returns false at
// end of input.
bool read_frame(std::istream& in, std::string& frame, std::size_t limit) {
  frame.clear();
  bool read_any = false;
  char ch = 0;
  while (in.get(ch)) {
    read_any = true;
    if (ch == '\n') {
      return true;
    }
    if (frame.size() <= limit) {
      frame.push_back(ch);
    }
  }
  return read_any;
}

}  // namespace

Dispatcher::Dispatcher(ServerContext& ctx)
    : ctx_(ctx), methods_(build_method_registry()), notifications_(build_notification_registry()) {}

std::optional<std::string> Dispatcher::handle_line(const std::string& line) {
  if (is_blank(line)) {
    return std::nullopt;
  }

  auto parsed = protocol::parse_message(line, ctx_.config.max_message_bytes);
  if (!parsed.has_value()) {
    const auto& frame_error = parsed.error();
    if (frame_error.code == protocol::kParseError && !frame_error.salvaged_id.has_value()) {
      std::cerr << "Dropped unparseable frame: " << frame_error.message << "\n";
      return std::nullopt;
    }
    return protocol::make_error_response(reply_id(frame_error.salvaged_id), frame_error.code,
                                         frame_error.message);
  }

  const auto& message = parsed.value();
  switch (message.kind()) {
    case protocol::MessageKind::kRequest:
      return handle_request(message);
    case protocol::MessageKind::kNotification:
      handle_notification(message);
      return std::nullopt;
    case protocol::MessageKind::kResponse:
      handle_response(message);
      return std::nullopt;
    case protocol::MessageKind::kInvalid:
      break;
  }
  return protocol::make_error_response(reply_id(message.id), protocol::kInvalidRequest,
                                       "Invalid message: not a request, notification or response");
}

std::string Dispatcher::handle_request(const protocol::JsonRpcMessage& req) {
  const auto& method = req.method.value();
  std::cerr << "Received: " << method << "\n";

  auto it = methods_.find(method);
  if (it == methods_.end()) {
    return protocol::make_error_response(req.id, protocol::kMethodNotFound,
                                         "Method not found: " + method);
  }

  try {
    auto result = it->second(req, ctx_);
    if (!result.has_value()) {
      const auto& error = result.error();
      return protocol::make_error_response(req.id, error.code, error.message, error.data);
    }
    return protocol::make_response(req.id, result.value());
  } catch (const std::exception& e) {
    std::cerr << "Handler for " << method << " failed: " << e.what() << "\n";
    return protocol::make_error_response(req.id, protocol::kInternalError,
                                         std::string("Internal error: ") + e.what());
  }
}

void Dispatcher::handle_notification(const protocol::JsonRpcMessage& msg) {
  const auto& method = msg.method.value();
  auto it = notifications_.find(method);
  if (it == notifications_.end()) {
    std::cerr << "Ignored unknown notification: " << method << "\n";
    return;
  }
  try {
    it->second(msg, ctx_);
  } catch (const std::exception& e) {
    std::cerr << "Notification " << method << " failed: " << e.what() << "\n";
  }
}

void Dispatcher::handle_response(const protocol::JsonRpcMessage& msg) {
  const auto id = msg.numeric_id();
  if (!id.has_value()) {
    std::cerr << "Dropped response with non-numeric id: " << msg.id->dump() << "\n";
    return;
  }
  if (!ctx_.session.resolve_pending(id.value(), msg)) {
    std::cerr << "Dropped response for unknown request id=" << id.value() << "\n";
  }
}

void run_server_loop(ServerContext& ctx, std::istream& in) {
  Dispatcher dispatcher(ctx);

  // Main loop: read JSON-RPC frames from in, write replies through the shared writer
  std::string line;
  while (read_frame(in, line, ctx.config.max_message_bytes)) {
    auto reply = dispatcher.handle_line(line);
    if (reply.has_value() && !ctx.writer.write(reply.value())) {
      std::cerr << "Output stream closed; stopping\n";
      break;
    }
  }

  std::cerr << "MCP Server shutting down\n";
  ctx.roots.shutdown();
  ctx.engines.close_all();
}

}  // namespace ckmcp::mcp
