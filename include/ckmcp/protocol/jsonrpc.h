#pragma once

#include "ckmcp/core/result.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace ckmcp::protocol {

// Error codes (JSON-RPC 2.0 spec + custom)
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
// Extension: a named tool or resource does not exist.
constexpr int kNotFound = -32002;

// Reference upper bound on one newline-delimited frame.
constexpr std::size_t kMaxMessageSize = 1024 * 1024;

struct JsonRpcError {
  int code{0};          // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)
  nlohmann::json data;  // NOLINT(readability-identifier-naming)
};

// MessageKind is derived from field presence; it is never read off the wire.
enum class MessageKind {
  kRequest,       // method + id
  kNotification,  // method, no id
  kResponse,      // no method, id, exactly one of result/error
  kInvalid,
};

// JsonRpcMessage is one parsed JSON-RPC 2.0 envelope.
//
// An absent field is std::nullopt. An explicit JSON null is kept as a present value,
// so {"id": null} has an id (which is not numeric).
struct JsonRpcMessage {
  std::string jsonrpc{"2.0"};                // NOLINT(readability-identifier-naming)
  std::optional<nlohmann::json> id;          // NOLINT(readability-identifier-naming)
  std::optional<std::string> method;         // NOLINT(readability-identifier-naming)
  std::optional<nlohmann::json> params;      // NOLINT(readability-identifier-naming)
  std::optional<nlohmann::json> result;      // NOLINT(readability-identifier-naming)
  std::optional<JsonRpcError> error;         // NOLINT(readability-identifier-naming)
  bool malformed{false};                     // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool is_request() const;
  [[nodiscard]] bool is_notification() const;
  [[nodiscard]] bool is_response() const;
  [[nodiscard]] MessageKind kind() const;

  // Integer view of id, for correlating replies to server-initiated requests.
  [[nodiscard]] std::optional<std::int64_t> numeric_id() const;
};

// FrameError describes why a raw frame could not become a JsonRpcMessage.
// salvaged_id is set when the frame still carried a readable top-level id.
struct FrameError {
  int code{kParseError};                      // NOLINT(readability-identifier-naming)
  std::string message;                        // NOLINT(readability-identifier-naming)
  std::optional<nlohmann::json> salvaged_id;  // NOLINT(readability-identifier-naming)
};

// Parse one frame. Fails with kParseError for oversized or non-JSON input and with
// kInvalidRequest when the JSON is not an object.
[[nodiscard]] core::Result<JsonRpcMessage, FrameError> parse_message(
    const std::string& frame, std::size_t max_size = kMaxMessageSize);

// Serialize a message to its single-line wire form (no trailing newline).
[[nodiscard]] std::string serialize_message(const JsonRpcMessage& message);

// Create JSON-RPC success response
[[nodiscard]] std::string make_response(const std::optional<nlohmann::json>& id,
                                        const nlohmann::json& result);

// Create JSON-RPC error response
[[nodiscard]] std::string make_error_response(const std::optional<nlohmann::json>& id, int code,
                                              const std::string& message,
                                              const nlohmann::json& data = nullptr);

// Create a server-initiated request or notification.
[[nodiscard]] std::string make_request(std::int64_t id, const std::string& method,
                                       const std::optional<nlohmann::json>& params = std::nullopt);
[[nodiscard]] std::string make_notification(
    const std::string& method, const std::optional<nlohmann::json>& params = std::nullopt);

}  // namespace ckmcp::protocol
