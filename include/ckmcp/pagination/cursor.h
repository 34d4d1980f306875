#pragma once

#include "ckmcp/core/result.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace ckmcp::pagination {

constexpr int kCursorVersion = 1;

// CursorData is what a tools/list cursor binds together.
struct CursorData {
  std::int64_t version{kCursorVersion};  // NOLINT(readability-identifier-naming)
  std::string preset;                    // NOLINT(readability-identifier-naming)
  std::int64_t offset{0};                // NOLINT(readability-identifier-naming)
  std::string fingerprint;               // NOLINT(readability-identifier-naming)
};

// encode_cursor serializes {"v","p","o","h"} as compact JSON in URL-safe base64 without
// padding.
[[nodiscard]] std::string encode_cursor(std::string_view preset, std::int64_t offset,
                                        std::string_view fingerprint);

// decode_cursor returns the offset a cursor points at, provided it was minted under exactly
// (preset, fingerprint). An empty cursor is the first page and always yields 0.
//
// Error messages: "invalid cursor encoding", "invalid cursor format",
// "cursor version mismatch", "preset changed", "toolset changed", "invalid offset".
[[nodiscard]] core::Result<std::int64_t, std::string> decode_cursor(std::string_view cursor,
                                                                    std::string_view preset,
                                                                    std::string_view fingerprint);

}  // namespace ckmcp::pagination
