#pragma once

#include "ckmcp/pagination/cursor.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ckmcp::pagination {

constexpr int kDefaultPageSize = 15;

template <typename T>
struct Page {
  std::vector<T> items;                   // NOLINT(readability-identifier-naming)
  std::optional<std::string> next_cursor;  // NOLINT(readability-identifier-naming)
};

// normalize_page_size maps a missing or non-positive size to kDefaultPageSize.
[[nodiscard]] inline int normalize_page_size(int page_size) {
  return page_size > 0 ? page_size : kDefaultPageSize;
}

// paginate slices items[offset, offset + page_size). A next cursor is minted under
// (preset, fingerprint) only when more items remain after this page.
template <typename T>
[[nodiscard]] Page<T> paginate(const std::vector<T>& items, std::int64_t offset, int page_size,
                               std::string_view preset, std::string_view fingerprint) {
  Page<T> page;
  const auto size = static_cast<std::int64_t>(normalize_page_size(page_size));
  const auto length = static_cast<std::int64_t>(items.size());
  if (offset < 0) {
    offset = 0;
  }
  if (offset >= length) {
    return page;
  }

  const std::int64_t end = std::min(offset + size, length);
  page.items.assign(items.begin() + offset, items.begin() + end);
  if (offset + size < length) {
    page.next_cursor = encode_cursor(preset, end, fingerprint);
  }
  return page;
}

}  // namespace ckmcp::pagination
