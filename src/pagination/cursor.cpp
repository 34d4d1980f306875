#include "ckmcp/pagination/cursor.h"

#include "ckmcp/core/base64.h"

#include <nlohmann/json.hpp>

namespace ckmcp::pagination {

using json = nlohmann::json;

std::string encode_cursor(std::string_view preset, std::int64_t offset,
                          std::string_view fingerprint) {
  const json payload = {
      {"v", kCursorVersion},
      {"p", std::string(preset)},
      {"o", offset},
      {"h", std::string(fingerprint)},
  };
  return core::base64url_encode(payload.dump());
}

core::Result<std::int64_t, std::string> decode_cursor(std::string_view cursor,
                                                      std::string_view preset,
                                                      std::string_view fingerprint) {
  using R = core::Result<std::int64_t, std::string>;

  if (cursor.empty()) {
    return R::ok(0);
  }

  const auto raw = core::base64url_decode(cursor);
  if (!raw.has_value()) {
    return R::err("invalid cursor encoding");
  }

  const auto payload = json::parse(raw.value(), nullptr, /*allow_exceptions=*/false);
  if (!payload.is_object() || !payload.contains("v") || !payload["v"].is_number_integer() ||
      !payload.contains("p") || !payload["p"].is_string() || !payload.contains("o") ||
      !payload["o"].is_number_integer() || !payload.contains("h") || !payload["h"].is_string()) {
    return R::err("invalid cursor format");
  }

  CursorData data{
      .version = payload["v"].get<std::int64_t>(),
      .preset = payload["p"].get<std::string>(),
      .offset = payload["o"].get<std::int64_t>(),
      .fingerprint = payload["h"].get<std::string>(),
  };

  if (data.version != kCursorVersion) {
    return R::err("cursor version mismatch");
  }
  if (data.preset != preset) {
    return R::err("preset changed");
  }
  if (data.fingerprint != fingerprint) {
    return R::err("toolset changed");
  }
  if (data.offset < 0) {
    return R::err("invalid offset");
  }
  return R::ok(data.offset);
}

}  // namespace ckmcp::pagination
