#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ckmcp::core {

// URL-safe base64 (RFC 4648 §5) without '=' padding.
[[nodiscard]] std::string base64url_encode(std::string_view input);

// Returns nullopt on any character outside the URL-safe alphabet, on '=' padding,
// or on an impossible length (len % 4 == 1).
[[nodiscard]] std::optional<std::string> base64url_decode(std::string_view input);

}  // namespace ckmcp::core
