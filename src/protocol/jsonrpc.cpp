#include "ckmcp/protocol/jsonrpc.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string_view>

namespace ckmcp::protocol {

using json = nlohmann::json;

namespace {

// Reads the top-level "id" from the first max_size bytes of a frame. The prefix is usually
// cut mid-document, so the parse is expected to fail after the id has been seen. Everything
// other than the top-level object and its id is discarded as it is parsed.
std::optional<json> salvage_id(std::string_view frame, std::size_t max_size) {
  const auto prefix = frame.substr(0, max_size);
  std::optional<json> id;
  bool at_id = false;

  json::parser_callback_t keep_id = [&](int depth, json::parse_event_t event, json& parsed) {
    switch (event) {
      case json::parse_event_t::object_start:
        return depth == 0;
      case json::parse_event_t::key:
        at_id = depth == 1 && !id.has_value() && parsed == "id";
        return at_id;
      case json::parse_event_t::value:
        if (depth == 1 && at_id && (parsed.is_string() || parsed.is_number())) {
          id = parsed;
        }
        at_id = false;
        return false;
      case json::parse_event_t::array_start:
        return false;
      case json::parse_event_t::object_end:
      case json::parse_event_t::array_end:
        return depth == 0;
    }
    return false;
  };

  static_cast<void>(json::parse(prefix.begin(), prefix.end(), keep_id, /*allow_exceptions=*/false));
  return id;
}

bool fits_int(const json& value) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>() <=
           static_cast<std::uint64_t>(std::numeric_limits<int>::max());
  }
  if (!value.is_number_integer()) {
    return false;
  }
  const auto number = value.get<std::int64_t>();
  return number >= std::numeric_limits<int>::min() && number <= std::numeric_limits<int>::max();
}

void put_id(json& envelope, const std::optional<json>& id) {
  if (id.has_value()) {
    envelope["id"] = id.value();
  } else {
    envelope["id"] = nullptr;
  }
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Classification
// ────────────────────────────────────────────────────────────────

MessageKind JsonRpcMessage::kind() const {
  if (malformed) {
    return MessageKind::kInvalid;
  }
  const bool has_outcome = result.has_value() || error.has_value();
  if (method.has_value()) {
    if (has_outcome) {
      return MessageKind::kInvalid;
    }
    return id.has_value() ? MessageKind::kRequest : MessageKind::kNotification;
  }
  if (id.has_value() && result.has_value() != error.has_value()) {
    return MessageKind::kResponse;
  }
  return MessageKind::kInvalid;
}

bool JsonRpcMessage::is_request() const {
  return kind() == MessageKind::kRequest;
}

bool JsonRpcMessage::is_notification() const {
  return kind() == MessageKind::kNotification;
}

bool JsonRpcMessage::is_response() const {
  return kind() == MessageKind::kResponse;
}

std::optional<std::int64_t> JsonRpcMessage::numeric_id() const {
  if (!id.has_value()) {
    return std::nullopt;
  }
  const json& value = id.value();
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  if (value.is_number_float()) {
    // Some peers echo integer ids back as doubles.
    const double d = value.get<double>();
    if (std::isfinite(d) && std::floor(d) == d &&
        std::fabs(d) < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
      return static_cast<std::int64_t>(d);
    }
  }
  return std::nullopt;
}

// ────────────────────────────────────────────────────────────────
// Parsing
// ────────────────────────────────────────────────────────────────

core::Result<JsonRpcMessage, FrameError> parse_message(const std::string& frame,
                                                       std::size_t max_size) {
  using R = core::Result<JsonRpcMessage, FrameError>;

  if (frame.size() > max_size) {
    return R::err(FrameError{
        .code = kParseError,
        .message = "Message exceeds maximum size of " + std::to_string(max_size) + " bytes",
        .salvaged_id = salvage_id(frame, max_size),
    });
  }

  json parsed;
  try {
    parsed = json::parse(frame);
  } catch (const json::parse_error& e) {
    return R::err(FrameError{
        .code = kParseError,
        .message = std::string("Invalid JSON: ") + e.what(),
        .salvaged_id = std::nullopt,
    });
  }

  if (!parsed.is_object()) {
    return R::err(FrameError{
        .code = kInvalidRequest,
        .message = "Invalid message: expected a JSON object",
        .salvaged_id = std::nullopt,
    });
  }

  JsonRpcMessage message;
  if (parsed.contains("jsonrpc")) {
    if (parsed["jsonrpc"].is_string()) {
      message.jsonrpc = parsed["jsonrpc"].get<std::string>();
    } else {
      message.malformed = true;
    }
  }

  if (parsed.contains("id")) {
    const json& id = parsed["id"];
    message.id = id;
    if (!id.is_string() && !id.is_number() && !id.is_null()) {
      message.malformed = true;
    }
  }

  if (parsed.contains("method")) {
    if (parsed["method"].is_string()) {
      message.method = parsed["method"].get<std::string>();
    } else {
      message.malformed = true;
    }
  }

  if (parsed.contains("params")) {
    message.params = parsed["params"];
  }

  if (parsed.contains("result")) {
    message.result = parsed["result"];
  }

  if (parsed.contains("error")) {
    const json& err = parsed["error"];
    if (err.is_object() && err.contains("code") && fits_int(err["code"])) {
      JsonRpcError rpc_error;
      rpc_error.code = static_cast<int>(err["code"].get<std::int64_t>());
      if (err.contains("message") && err["message"].is_string()) {
        rpc_error.message = err["message"].get<std::string>();
      }
      if (err.contains("data")) {
        rpc_error.data = err["data"];
      }
      message.error = rpc_error;
    } else {
      message.malformed = true;
    }
  }

  return R::ok(std::move(message));
}

// ────────────────────────────────────────────────────────────────
// Serialization
// ────────────────────────────────────────────────────────────────

std::string serialize_message(const JsonRpcMessage& message) {
  json envelope;
  envelope["jsonrpc"] = message.jsonrpc;
  if (message.id.has_value()) {
    envelope["id"] = message.id.value();
  }
  if (message.method.has_value()) {
    envelope["method"] = message.method.value();
  }
  if (message.params.has_value()) {
    envelope["params"] = message.params.value();
  }
  if (message.result.has_value()) {
    envelope["result"] = message.result.value();
  }
  if (message.error.has_value()) {
    json err = {
        {"code", message.error->code},
        {"message", message.error->message},
    };
    if (!message.error->data.is_null()) {
      err["data"] = message.error->data;
    }
    envelope["error"] = err;
  }
  return envelope.dump();
}

std::string make_response(const std::optional<json>& id, const json& result) {
  json response;
  response["jsonrpc"] = "2.0";
  put_id(response, id);
  response["result"] = result;
  return response.dump();
}

std::string make_error_response(const std::optional<json>& id, int code,
                                const std::string& message, const json& data) {
  json response;
  response["jsonrpc"] = "2.0";
  put_id(response, id);
  response["error"] = {
      {"code", code},
      {"message", message},
  };
  if (!data.is_null()) {
    response["error"]["data"] = data;
  }
  return response.dump();
}

std::string make_request(std::int64_t id, const std::string& method,
                         const std::optional<json>& params) {
  json request;
  request["jsonrpc"] = "2.0";
  request["id"] = id;
  request["method"] = method;
  if (params.has_value()) {
    request["params"] = params.value();
  }
  return request.dump();
}

std::string make_notification(const std::string& method, const std::optional<json>& params) {
  json notification;
  notification["jsonrpc"] = "2.0";
  notification["method"] = method;
  if (params.has_value()) {
    notification["params"] = params.value();
  }
  return notification.dump();
}

}  // namespace ckmcp::protocol
